//===----------------------------------------------------------------------===//
//
// Part of the Radiant project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: fs/Node.hpp
// Purpose: Declares the reference-counted Node base, the payload-carrying
//          BasicNode template and the byte-holding File node.
// Key invariants: references() equals the number of Entries registered
//                 against the node; it is only changed by entryAdded and
//                 entryRemoved.
// Ownership/Lifetime: Nodes are owned by the FileSystem they are added to.
//                     The back-pointer to that FileSystem is non-owning and is
//                     cleared when the node leaves the registry.
// Links: docs/architecture.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "fs/Ids.hpp"
#include "support/diag_expected.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

namespace radiant::fs
{

class Entry;
class FileSystem;

/// @brief Concrete node flavours, used by listings and path walking.
enum class NodeKind
{
    File,
    Directory,
    ExternDirectory
};

/// @brief Lowercase name of @p kind ("file", "directory", "mount").
const char *nodeKindName(NodeKind kind) noexcept;

/// @brief Base class for data nodes in the file system.
/// @details Construction has no side effects; a node becomes part of a
///          namespace when handed to FileSystem::addNode.  The node then
///          tracks how many registered Entries refer to it and removes itself
///          when the last one goes away.
class Node
{
  public:
    virtual ~Node() = default;

    Node(const Node &) = delete;
    Node &operator=(const Node &) = delete;

    [[nodiscard]] NodeId id() const noexcept
    {
        return id_;
    }

    /// @brief Number of registered Entries targeting this node.
    [[nodiscard]] int references() const noexcept
    {
        return references_;
    }

    /// @brief Owning file system, or nullptr when not registered.
    [[nodiscard]] FileSystem *filesystem() const noexcept
    {
        return filesystem_;
    }

    [[nodiscard]] virtual NodeKind kind() const noexcept = 0;

    /// @brief True for Directory and ExternDirectory nodes.
    [[nodiscard]] bool isDirectory() const noexcept;

    /// @brief Executed when an Entry representing this node is registered.
    void entryAdded(const Entry &entry);

    /// @brief Executed when an Entry representing this node is deregistered.
    /// @details Drops the reference count and, when it reaches zero, removes
    ///          the node from its file system.
    /// @return Ownership of this node if it was removed, otherwise nullptr.
    ///         Callers must not touch the node through other pointers once a
    ///         non-null result has been released.
    support::Expected<std::unique_ptr<Node>> entryRemoved(const Entry &entry);

    /// @brief Remove this node from its file system, whatever its count.
    /// @details Entries that still target the node are left dangling.
    /// @return Ownership of the removed node; NotFound when it is not
    ///         registered.
    support::Expected<std::unique_ptr<Node>> remove();

  protected:
    Node();

  private:
    friend class FileSystem;

    NodeId id_;
    int references_ = 0;
    FileSystem *filesystem_ = nullptr;
};

/// @brief Node carrying a payload of type @p T.
template <typename T> class BasicNode : public Node
{
  public:
    using Payload = T;

    T &data() noexcept
    {
        return data_;
    }

    const T &data() const noexcept
    {
        return data_;
    }

  protected:
    explicit BasicNode(T data = T{}) : data_(std::move(data)) {}

    T data_;
};

/// @brief Ordinary data-holding file.
class File final : public BasicNode<std::vector<uint8_t>>
{
  public:
    using Bytes = std::vector<uint8_t>;

    explicit File(Bytes data = {});

    [[nodiscard]] NodeKind kind() const noexcept override;

    /// @brief Payload length in bytes.
    [[nodiscard]] size_t size() const noexcept;
};

} // namespace radiant::fs
