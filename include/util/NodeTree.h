//  Created by Carl Johan Gribel 2024-2025
//  Licensed under the MIT License. See LICENSE file for details.

#ifndef NodeTree_h
#define NodeTree_h

#include <concepts>
#include <queue>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#define NodeTree_NullIndex static_cast<size_t>(-1)

template<class T>
struct NodeTreeNode
{
    unsigned m_nbr_children = 0;    // Nbr of children
    unsigned m_branch_stride = 1;   // Branch size including this node
    unsigned m_parent_ofs = 0;      // Distance to parent, relative parent. 0 = root.
    size_t m_node_index = 0;        // Handle, unique within the tree and never reused
    T m_payload;                    // Payload
};

/**
Sequential tree representation optimized for depth-first traversal.
Nodes are organized in pre-order, so a node's branch occupies a contiguous range starting at the node.
Nodes are addressed by a node index (handle) assigned in strictly increasing order at insertion;
handles of erased nodes are never handed out again. Positions (offsets into the pre-order
sequence) change on insertion and erasure and are only valid until the next structural edit.
Children are appended after their existing siblings, so sibling order equals insertion order.
*/
template <class PayloadType>
class NodeTree
{
    template<class> friend class NodeTree;

    using TreeNodeType = NodeTreeNode<PayloadType>;
    std::vector<TreeNodeType> nodes;
    size_t m_next_node_index = 0;

public:
    NodeTree() = default;

    /// @brief Find the position of a node O(N)
    /// @param node_index Node handle to search for
    /// @return Position in the pre-order sequence, or NodeTree_NullIndex
    size_t find_position(size_t node_index) const
    {
        for (size_t pos = 0; pos < nodes.size(); ++pos)
            if (nodes[pos].m_node_index == node_index) return pos;
        return NodeTree_NullIndex;
    }

    /// @brief Find the first node, in depth-first order, whose payload satisfies pred
    /// @return Node handle, or NodeTree_NullIndex
    template<class F>
        requires std::predicate<F, const PayloadType&>
    size_t find_node_index_if(F&& pred) const
    {
        for (const auto& node : nodes)
            if (pred(node.m_payload)) return node.m_node_index;
        return NodeTree_NullIndex;
    }

    inline size_t size() const
    {
        return nodes.size();
    }

    inline bool empty() const
    {
        return nodes.empty();
    }

    /// @brief Handle the next inserted node will receive
    size_t next_node_index() const
    {
        return m_next_node_index;
    }

    /// @brief Remove all nodes. Handles already issued stay retired.
    void clear()
    {
        nodes.clear();
    }

    bool contains(size_t node_index) const
    {
        return find_position(node_index) != NodeTree_NullIndex;
    }

    size_t node_index_at(size_t position) const
    {
        return checked_node_at(position).m_node_index;
    }

    const PayloadType& get_payload_at(size_t position) const
    {
        return checked_node_at(position).m_payload;
    }

    PayloadType& get_payload_at(size_t position)
    {
        return const_cast<TreeNodeType&>(std::as_const(*this).checked_node_at(position)).m_payload;
    }

    const PayloadType& get_payload(size_t node_index) const
    {
        return nodes[checked_position(node_index)].m_payload;
    }

    PayloadType& get_payload(size_t node_index)
    {
        return nodes[checked_position(node_index)].m_payload;
    }

    unsigned get_nbr_children(size_t node_index) const
    {
        return nodes[checked_position(node_index)].m_nbr_children;
    }

    unsigned get_branch_size(size_t node_index) const
    {
        return nodes[checked_position(node_index)].m_branch_stride;
    }

    bool is_root(size_t node_index) const
    {
        return nodes[checked_position(node_index)].m_parent_ofs == 0;
    }

    bool is_leaf(size_t node_index) const
    {
        return nodes[checked_position(node_index)].m_nbr_children == 0;
    }

    /// @brief Handle of the parent node, or NodeTree_NullIndex for a root
    size_t get_parent(size_t node_index) const
    {
        const size_t pos = checked_position(node_index);
        if (nodes[pos].m_parent_ofs == 0) return NodeTree_NullIndex;
        return nodes[pos - nodes[pos].m_parent_ofs].m_node_index;
    }

    /// @brief Handles of the direct children, in sibling order
    std::vector<size_t> get_children(size_t node_index) const
    {
        std::vector<size_t> children;
        const size_t pos = checked_position(node_index);
        size_t child_pos = pos + 1;
        for (unsigned i = 0; i < nodes[pos].m_nbr_children; ++i)
        {
            children.push_back(nodes[child_pos].m_node_index);
            child_pos += nodes[child_pos].m_branch_stride;
        }
        return children;
    }

    bool is_descendant_of(size_t node_index, size_t ancestor_node_index) const
    {
        const size_t ancestor_pos = find_position(ancestor_node_index);
        const size_t pos = find_position(node_index);
        if (ancestor_pos == NodeTree_NullIndex || pos == NodeTree_NullIndex)
            return false;
        return pos > ancestor_pos && pos < ancestor_pos + nodes[ancestor_pos].m_branch_stride;
    }

    /// @brief Returns the handles of all root nodes in the forest.
    std::vector<size_t> get_roots() const
    {
        std::vector<size_t> roots;
        size_t i = 0;
        while (i < nodes.size()) {
            roots.push_back(nodes[i].m_node_index);
            i += nodes[i].m_branch_stride;
        }
        return roots;
    }

    /// @brief Append a new root after all existing branches
    /// @return Handle of the inserted node
    size_t insert_as_root(const PayloadType& payload)
    {
        const size_t node_index = m_next_node_index++;
        nodes.push_back(
            TreeNodeType{
                .m_nbr_children = 0,
                .m_branch_stride = 1,
                .m_parent_ofs = 0, // root
                .m_node_index = node_index,
                .m_payload = payload });
        return node_index;
    }

    /// @brief Insert a node as the last child of a parent
    /// @param payload Payload to insert
    /// @param parent_node_index Handle of parent node.
    /// @return Handle of the inserted node, or NodeTree_NullIndex if the parent does not exist
    size_t insert(
        PayloadType const& payload,
        size_t parent_node_index)
    {
        const size_t parent_pos = find_position(parent_node_index);
        if (parent_pos == NodeTree_NullIndex)
            return NodeTree_NullIndex;

        // New node goes directly after the parent's current branch
        const size_t insert_pos = parent_pos + nodes[parent_pos].m_branch_stride;

        // Update branch_stride of ancestors
        for (size_t idx = parent_pos; ; )
        {
            nodes[idx].m_branch_stride += 1;
            if (nodes[idx].m_parent_ofs == 0)
                break;
            idx -= nodes[idx].m_parent_ofs;
        }

        // Trailing nodes whose parent precedes the insertion point move one step further away
        for (size_t i = insert_pos; i < nodes.size(); ++i)
        {
            if (nodes[i].m_parent_ofs == 0)
                break;
            if (nodes[i].m_parent_ofs > i - insert_pos)
                nodes[i].m_parent_ofs += 1;
        }

        nodes[parent_pos].m_nbr_children += 1;

        const size_t node_index = m_next_node_index++;
        nodes.insert(
            nodes.begin() + insert_pos,
            TreeNodeType{
                .m_nbr_children = 0,
                .m_branch_stride = 1,
                .m_parent_ofs = static_cast<unsigned>(insert_pos - parent_pos),
                .m_node_index = node_index,
                .m_payload = payload });

        return node_index;
    }

    /// @brief Erase a node and its entire branch
    /// @return False if no node has the handle
    bool erase_branch(size_t node_index)
    {
        const size_t pos = find_position(node_index);
        if (pos == NodeTree_NullIndex)
            return false;
        erase_branch_at_position(pos);
        return true;
    }

    /// @brief Copy the structure and handles, mapping each payload through func
    template<class U, class F>
        requires std::invocable<F, const PayloadType&>
    NodeTree<U> convert(F&& func) const
    {
        NodeTree<U> result;
        result.nodes.reserve(nodes.size());
        for (const auto& node : nodes)
        {
            result.nodes.push_back(
                NodeTreeNode<U>{
                    .m_nbr_children = node.m_nbr_children,
                    .m_branch_stride = node.m_branch_stride,
                    .m_parent_ofs = node.m_parent_ofs,
                    .m_node_index = node.m_node_index,
                    .m_payload = func(node.m_payload) });
        }
        result.m_next_node_index = m_next_node_index;
        return result;
    }

private:
    size_t checked_position(size_t node_index) const
    {
        const size_t pos = find_position(node_index);
        if (pos == NodeTree_NullIndex)
            throw std::out_of_range("NodeTree: no node with index " + std::to_string(node_index));
        return pos;
    }

    const TreeNodeType& checked_node_at(size_t position) const
    {
        if (position >= nodes.size())
            throw std::out_of_range("NodeTree: position " + std::to_string(position) + " out of range");
        return nodes[position];
    }

    void erase_branch_at_position(size_t node_pos)
    {
        auto const branch_stride = nodes[node_pos].m_branch_stride;
        auto const parent_ofs = nodes[node_pos].m_parent_ofs;

        // Special-case: root
        if (parent_ofs == 0) {
            nodes.erase(nodes.begin() + node_pos,
                nodes.begin() + node_pos + branch_stride);
            return;
        }

        // Update branch_stride of ancestors
        size_t parent_pos = node_pos - parent_ofs;
        for (size_t idx = parent_pos; ; idx -= nodes[idx].m_parent_ofs)
        {
            nodes[idx].m_branch_stride -= branch_stride;
            if (nodes[idx].m_parent_ofs == 0)
                break;
        }

        // Trailing nodes whose parent precedes the erased branch move closer to it
        for (size_t i = node_pos + branch_stride; i < nodes.size(); ++i)
        {
            if (nodes[i].m_parent_ofs == 0) break;
            if (nodes[i].m_parent_ofs > i - node_pos)
                nodes[i].m_parent_ofs -= branch_stride;
        }

        nodes[parent_pos].m_nbr_children--;
        nodes.erase(
            nodes.begin() + node_pos,
            nodes.begin() + node_pos + branch_stride);
    }

    // --- Depth-first without level information (fast) -----------------------

    template<class T, class F>
    static void traverse_depthfirst_impl(
        T& self,
        size_t start_pos,
        F&& func)
    {
        auto& nodes = self.nodes;
        if (start_pos >= nodes.size())
            return;

        size_t stride = nodes[start_pos].m_branch_stride;
        for (size_t offset = 0; offset < stride; ++offset)
        {
            size_t pos = start_pos + offset;
            auto& node = nodes[pos];

            const size_t parent_pos =
                node.m_parent_ofs ?
                pos - node.m_parent_ofs
                : NodeTree_NullIndex;
            auto parent_ptr =
                parent_pos != NodeTree_NullIndex ?
                &nodes[parent_pos].m_payload
                : nullptr;

            func(&node.m_payload, parent_ptr, pos, parent_pos);
        }
    }

    template<class T, class F>
    static void traverse_depthfirst_impl(
        T& self,
        F&& func)
    {
        size_t i = 0;
        while (i < self.size()) {
            traverse_depthfirst_impl(self, i, func);
            i += self.nodes[i].m_branch_stride;
        }
    }

public:
    /// @brief Traverse the whole forest in depth-first order (const overload)
    /// @param func Callable with signature
    ///        void(const PayloadType* node,
    ///             const PayloadType* parent,
    ///             size_t node_position,
    ///             size_t parent_position).
    ///        Parent is nullptr and parent_position NodeTree_NullIndex for roots.
    /// @note A parent is always visited before its descendants.
    template<class F>
        requires std::invocable<F, const PayloadType*, const PayloadType*, size_t, size_t>
    void traverse_depthfirst(F&& func) const
    {
        traverse_depthfirst_impl(*this, std::forward<F>(func));
    }

    /// @brief Traverse the whole forest in depth-first order
    template<class F>
        requires std::invocable<F, PayloadType*, PayloadType*, size_t, size_t>
    void traverse_depthfirst(F&& func)
    {
        traverse_depthfirst_impl(*this, std::forward<F>(func));
    }

    /// @brief Traverse a branch in depth-first order, starting at a node handle
    template<class F>
        requires std::invocable<F, const PayloadType*, const PayloadType*, size_t, size_t>
    void traverse_depthfirst(size_t start_node_index, F&& func) const
    {
        traverse_depthfirst_impl(*this, checked_position(start_node_index), std::forward<F>(func));
    }

    // --- Depth-first with level information ---------------------------------

    /// @brief Traverse in depth-first order with level information
    /// @param func Callable with signature void(const PayloadType& payload, size_t position, size_t level).
    template<class F> requires std::invocable<F, const PayloadType&, size_t, size_t>
    void traverse_depthfirst_level(F&& func) const
    {
        std::vector<size_t> open_ends; // Positions one past each open ancestor branch
        for (size_t pos = 0; pos < nodes.size(); ++pos)
        {
            while (!open_ends.empty() && open_ends.back() <= pos)
                open_ends.pop_back();
            func(nodes[pos].m_payload, pos, open_ends.size());
            open_ends.push_back(pos + nodes[pos].m_branch_stride);
        }
    }

    // --- Breadth-first ------------------------------------------------------

    /// @brief Traverse in breadth-first order
    /// @param func Callable with signature void(const PayloadType& payload, size_t position).
    /// @note The tree is not optimized for breadth-first traversal.
    template<class F>
        requires std::invocable<F, const PayloadType&, size_t>
    void traverse_breadthfirst(F&& func) const
    {
        std::queue<size_t> q;
        for (size_t root = 0; root < nodes.size(); root += nodes[root].m_branch_stride)
            q.push(root);

        while (!q.empty())
        {
            size_t pos = q.front(); q.pop();
            const auto& node = nodes[pos];
            func(node.m_payload, pos);

            size_t child = pos + 1;
            for (unsigned i = 0; i < node.m_nbr_children; ++i)
            {
                q.push(child);
                child += nodes[child].m_branch_stride;
            }
        }
    }

    // --- Traverse children ---------------------------------------------------

    /// @brief Visit the direct children of a node
    /// @param visitor Callable with signature void(const PayloadType& payload, size_t child_node_index).
    template<typename F>
        requires std::invocable<F, const PayloadType&, size_t>
    void traverse_children(size_t parent_node_index, F&& visitor) const
    {
        const size_t parent_pos = checked_position(parent_node_index);
        size_t child_pos = parent_pos + 1;
        for (unsigned i = 0; i < nodes[parent_pos].m_nbr_children; ++i) {
            visitor(nodes[child_pos].m_payload, nodes[child_pos].m_node_index);
            child_pos += nodes[child_pos].m_branch_stride;
        }
    }

    // --- Ascend --------------------------------------------------------------

    /// @brief Ascend to root, starting with the node itself.
    /// @param func Callable with signature void(const PayloadType& payload, size_t node_index)
    template<class F>
        requires std::invocable<F, const PayloadType&, size_t>
    void ascend(size_t start_node_index, F&& func) const
    {
        size_t pos = checked_position(start_node_index);
        while (nodes[pos].m_parent_ofs)
        {
            func(nodes[pos].m_payload, nodes[pos].m_node_index);
            pos -= nodes[pos].m_parent_ofs;
        }
        func(nodes[pos].m_payload, nodes[pos].m_node_index);
    }
};

#endif /* NodeTree_h */
