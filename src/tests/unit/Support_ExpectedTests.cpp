//===----------------------------------------------------------------------===//
//
// Part of the Radiant project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/Support_ExpectedTests.cpp
// Purpose: Cover the Expected/Diag helpers and the diagnostic engine.
// Key invariants: An Expected holds exactly one of value or diagnostic.
// Ownership/Lifetime: Stack objects only.
// Links: docs/architecture.md
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/log.hpp"

#include <memory>
#include <sstream>
#include <string>

using namespace radiant::support;

TEST(SupportExpected, HoldsValueOrError)
{
    Expected<int> good = 7;
    ASSERT_TRUE(good);
    EXPECT_EQ(good.value(), 7);

    Expected<int> bad = makeError(ErrorCode::NotFound, "nothing here");
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.code(), ErrorCode::NotFound);
    EXPECT_EQ(bad.error().message, "nothing here");
    EXPECT_EQ(bad.error().severity, Severity::Error);
}

TEST(SupportExpected, CopiesPreserveState)
{
    Expected<std::string> original = std::string("text");
    Expected<std::string> copy = original;
    ASSERT_TRUE(copy);
    EXPECT_EQ(copy.value(), "text");
}

TEST(SupportExpected, MoveOnlyPayload)
{
    Expected<std::unique_ptr<int>> boxed = std::make_unique<int>(3);
    ASSERT_TRUE(boxed);
    std::unique_ptr<int> taken = std::move(boxed.value());
    EXPECT_EQ(*taken, 3);
}

TEST(SupportExpected, VoidSpecialization)
{
    Expected<void> ok;
    EXPECT_TRUE(ok);

    Expected<void> failed = makeError(ErrorCode::DuplicateName, "taken");
    ASSERT_FALSE(failed);
    EXPECT_EQ(failed.code(), ErrorCode::DuplicateName);
}

TEST(SupportExpected, PrintDiagIncludesCode)
{
    std::ostringstream os;
    printDiag(makeError(ErrorCode::InvalidLifecycleState, "too late"), os);
    EXPECT_EQ(os.str(), "error: too late [invalid-lifecycle-state]\n");

    std::ostringstream note;
    printDiag(Diag{Severity::Note, ErrorCode::None, "fyi"}, note);
    EXPECT_EQ(note.str(), "note: fyi\n");
}

TEST(SupportExpected, ErrorCodeNames)
{
    EXPECT_STREQ(errorCodeName(ErrorCode::NotFound), "not-found");
    EXPECT_STREQ(errorCodeName(ErrorCode::DuplicateName), "duplicate-name");
    EXPECT_STREQ(errorCodeName(ErrorCode::NotADirectory), "not-a-directory");
    EXPECT_STREQ(errorCodeName(ErrorCode::InvalidArgument), "invalid-argument");
}

TEST(SupportDiagnostics, EngineCountsBySeverity)
{
    DiagnosticEngine engine;
    engine.report(makeError(ErrorCode::NotFound, "a"));
    engine.report(Diagnostic{Severity::Warning, ErrorCode::None, "b"});
    engine.report(Diagnostic{Severity::Note, ErrorCode::None, "c"});
    EXPECT_EQ(engine.errorCount(), 1u);
    EXPECT_EQ(engine.warningCount(), 1u);

    std::ostringstream os;
    engine.printAll(os);
    EXPECT_EQ(os.str(), "error: a [not-found]\nwarning: b\nnote: c\n");
}

TEST(SupportLog, OverrideTogglesDebugLogging)
{
    setDebugLogging(true);
    EXPECT_TRUE(isDebugLoggingEnabled());
    setDebugLogging(false);
    EXPECT_FALSE(isDebugLoggingEnabled());
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
