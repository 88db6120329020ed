
// MIT License
//
// Copyright (c) 2020 degski
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.

#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <optional>
#include <sstream>
#include <string>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

#include <boost/container_hash/hash.hpp>

#include <tbb/null_mutex.h>
#include <tbb/spin_mutex.h>

#include "config.hpp"
#include "error.hpp"
#include "logging.hpp"
#include "node.hpp"
#include "nodes.hpp"

namespace tree_ds {

enum class removal_strategy {
    retain_children,         // The children of the removed node move up to its parent.
    remove_node_and_children // The whole sub-tree goes.
};

enum class traversal_strategy { pre_order, post_order, in_order };

namespace detail {

// Number of code points in a utf-8 string.
[[nodiscard]] inline std::size_t utf8_length ( std::string const & s_ ) noexcept {
    return static_cast<std::size_t> (
        std::count_if ( s_.begin ( ), s_.end ( ), [ ] ( char c ) { return ( static_cast<unsigned char> ( c ) & 0xC0 ) != 0x80; } ) );
}

template<typename Q, typename T, bool Concurrent = false>
class tree_base {

    public:
    using is_concurrent = std::integral_constant<bool, Concurrent>;
    using id_type       = Q;
    using value_type    = T;
    using node_type     = node_base<Q, T, Concurrent>;
    using nodes_type    = nodes_base<Q, T, Concurrent>;
    using mutex         = std::conditional_t<is_concurrent::value, tbb::spin_mutex, tbb::null_mutex>;
    using size_type     = std::size_t;

    explicit tree_base ( std::optional<std::string> name_ = std::nullopt ) : m_name{ std::move ( name_ ) } {}

    tree_base ( std::optional<std::string> name_, nodes_type nodes_ ) : m_name{ std::move ( name_ ) }, m_nodes{ std::move ( nodes_ ) } {}

    // Copying would share the node records between two trees, use clone ( ).
    tree_base ( tree_base const & ) = delete;
    // The mutex does not move, the new tree gets a fresh one.
    tree_base ( tree_base && other_ ) noexcept : m_name{ std::move ( other_.m_name ) }, m_nodes{ std::move ( other_.m_nodes ) } {}

    tree_base & operator= ( tree_base const & ) = delete;
    tree_base & operator= ( tree_base && other_ ) noexcept {
        m_name  = std::move ( other_.m_name );
        m_nodes = std::move ( other_.m_nodes );
        return *this;
    }

    [[nodiscard]] std::optional<std::string> const & name ( ) const noexcept { return m_name; }
    void rename ( std::optional<std::string> name_ ) { m_name = std::move ( name_ ); }

    [[nodiscard]] nodes_type const & get_nodes ( ) const noexcept { return m_nodes; }

    // A deep copy, the nodes of the copy have records of their own.
    [[nodiscard]] tree_base clone ( ) const {
        tree_base copy{ m_name };
        for ( node_type const & node : m_nodes )
            copy.m_nodes.push ( node.duplicate ( ) );
        return copy;
    }

    // The tree lock, for callers that need several operations to appear atomic.
    template<typename This = is_concurrent>
    std::enable_if_t<This::value> lock ( ) noexcept {
        m_mutex.lock ( );
    };
    template<typename This = is_concurrent>
    [[nodiscard]] std::enable_if_t<This::value, bool> try_lock ( ) noexcept {
        return m_mutex.try_lock ( );
    };
    template<typename This = is_concurrent>
    std::enable_if_t<This::value> unlock ( ) noexcept {
        m_mutex.unlock ( );
    };

    // Adds node_ as a child of parent_id_, or as the root if no parent is given.
    [[maybe_unused]] Q add_node ( node_type node_, std::optional<Q> const & parent_id_ = std::nullopt ) {
        if ( parent_id_ ) {
            node_type const parent = find ( *parent_id_ );
            parent.add_child ( node_ );
        }
        else if ( get_root_node ( ) ) {
            throw root_node_already_present{ };
        }
        Q id = node_.id ( );
        if ( logger ( )->should_log ( spdlog::level::trace ) )
            logger ( )->trace ( "add_node {} under {}", detail::to_string ( id ),
                                parent_id_ ? detail::to_string ( *parent_id_ ) : std::string{ "none" } );
        m_nodes.push ( std::move ( node_ ) );
        return id;
    }

    [[nodiscard]] std::optional<node_type> get_node_by_id ( Q const & id_ ) const { return m_nodes.get_by_id ( id_ ); }

    // The first node without a parent.
    [[nodiscard]] std::optional<node_type> get_root_node ( ) const {
        for ( node_type const & node : m_nodes )
            if ( not node.parent_id ( ) )
                return node;
        return std::nullopt;
    }

    // Number of edges on the longest downward path, level by level.
    [[nodiscard]] size_type get_node_height ( Q const & id_ ) const {
        id_queue<Q> queue;
        for ( Q const & child : find ( id_ ).children_ids ( ) )
            queue.push_back ( child );
        size_type height = 0, expanded = 0;
        while ( queue.size ( ) ) {
            ++height;
            for ( size_type level = queue.size ( ); level; --level ) {
                Q const id = de ( queue );
                if ( ++expanded > m_nodes.size ( ) )
                    throw invalid_operation{ "Node structure below node " + detail::to_string ( id_ ) + " is not a tree." };
                for ( Q const & child : find ( id ).children_ids ( ) )
                    queue.push_back ( child );
            }
        }
        return height;
    }

    [[nodiscard]] size_type get_node_depth ( Q const & id_ ) const { return get_ancestor_ids ( id_ ).size ( ); }

    // Parent ids, nearest first.
    [[nodiscard]] std::vector<Q> get_ancestor_ids ( Q const & id_ ) const {
        std::vector<Q> ancestors;
        std::optional<Q> parent = find ( id_ ).parent_id ( );
        while ( parent ) {
            if ( ancestors.size ( ) == m_nodes.size ( ) )
                throw invalid_operation{ "Parent chain of node " + detail::to_string ( id_ ) + " loops." };
            ancestors.push_back ( *parent );
            parent = find ( *parent ).parent_id ( );
        }
        return ancestors;
    }

    [[nodiscard]] size_type get_height ( ) const {
        std::optional<node_type> const root = get_root_node ( );
        if ( not root )
            throw invalid_operation{ "Tree has no root node" };
        return get_node_height ( root->id ( ) );
    }

    [[nodiscard]] size_type get_node_degree ( Q const & id_ ) const { return find ( id_ ).children_ids ( ).size ( ); }

    [[nodiscard]] std::vector<Q> get_sibling_ids ( Q const & id_, bool inclusive_ ) const {
        std::optional<Q> const parent_id = find ( id_ ).parent_id ( );
        if ( not parent_id ) {
            if ( inclusive_ )
                return { id_ };
            return { };
        }
        std::vector<Q> siblings = find ( *parent_id ).children_ids ( );
        if ( not inclusive_ )
            siblings.erase ( std::remove ( siblings.begin ( ), siblings.end ( ), id_ ), siblings.end ( ) );
        return siblings;
    }

    void remove_node ( Q const & id_, removal_strategy strategy_ ) {
        node_type const node = find ( id_ );
        if ( logger ( )->should_log ( spdlog::level::debug ) )
            logger ( )->debug ( "remove_node {} ({})", detail::to_string ( id_ ),
                                removal_strategy::retain_children == strategy_ ? "retain children" : "remove children" );
        if ( removal_strategy::retain_children == strategy_ ) {
            std::optional<Q> const parent_id = node.parent_id ( );
            if ( not parent_id )
                throw invalid_operation{ "Cannot remove root node with RetainChildren strategy" };
            node_type const parent = find ( *parent_id );
            parent.remove_child ( node );
            // Children found in the tree move over to the parent.
            for ( Q const & child_id : node.children_ids ( ) ) {
                if ( child_id == id_ or child_id == *parent_id )
                    continue;
                if ( std::optional<node_type> child = m_nodes.get_by_id ( child_id ) ) {
                    node.remove_child ( *child );
                    parent.add_child ( *child );
                }
            }
            m_nodes.retain ( [ &id_ ] ( node_type const & n_ ) { return n_.id ( ) != id_; } );
        }
        else {
            // Resolve the whole sub-tree before changing anything.
            std::unordered_set<Q> doomed{ id_ };
            std::vector<node_type> detached{ node };
            std::vector<Q> const children = node.children_ids ( );
            id_stack<Q> stack ( children.begin ( ), children.end ( ) );
            while ( stack.size ( ) ) {
                Q const id = pop ( stack );
                if ( not doomed.insert ( id ).second )
                    continue;
                detached.push_back ( find ( id ) );
                for ( Q const & child : detached.back ( ).children_ids ( ) )
                    stack.push_back ( child );
            }
            if ( std::optional<Q> const parent_id = node.parent_id ( ) )
                if ( *parent_id != id_ )
                    find ( *parent_id ).remove_child ( node );
            // Removed nodes keep no links, also through handles held outside the tree.
            for ( node_type const & removed : detached )
                for ( Q const & child_id : removed.children_ids ( ) )
                    if ( child_id != removed.id ( ) )
                        removed.remove_child ( find ( child_id ) );
            m_nodes.retain ( [ &doomed ] ( node_type const & n_ ) { return not doomed.count ( n_.id ( ) ); } );
        }
    }

    // A copy of id_ and its descendants, at most generations_ deep, in pre-order. The nodes at the
    // generation limit are copied without their children, the copy of id_ without its parent.
    [[nodiscard]] tree_base get_subtree ( Q const & id_, std::optional<int> generations_ = std::nullopt ) const {
        struct item {
            Q id;
            int generation;
        };
        node_type const top = find ( id_ );
        nodes_type nodes;
        std::unordered_set<Q> copied;
        std::vector<item> stack{ item{ id_, 0 } };
        while ( stack.size ( ) ) {
            item const current = std::move ( stack.back ( ) );
            stack.pop_back ( );
            if ( not copied.insert ( current.id ).second )
                continue;
            node_type const node = nodes.empty ( ) ? top : find ( current.id );
            bool const expand    = not generations_ or current.generation < *generations_;
            std::vector<Q> children = expand ? node.children_ids ( ) : std::vector<Q>{ };
            for ( auto it = children.rbegin ( ); it != children.rend ( ); ++it )
                stack.push_back ( item{ *it, current.generation + 1 } );
            std::optional<Q> parent = nodes.empty ( ) ? std::nullopt : node.parent_id ( );
            nodes.push ( node_type{ node.id ( ), node.value ( ), std::move ( children ), std::move ( parent ) } );
        }
        return tree_base{ detail::to_string ( id_ ), std::move ( nodes ) };
    }

    // Hangs the root of sub_tree_ below id_ and moves all its nodes into this tree.
    void add_subtree ( Q const & id_, tree_base sub_tree_ ) {
        node_type const node                 = find ( id_ );
        std::optional<node_type> const root = sub_tree_.get_root_node ( );
        if ( not root )
            throw invalid_operation{ "Subtree has no root node." };
        if ( logger ( )->should_log ( spdlog::level::debug ) )
            logger ( )->debug ( "add_subtree {} ({} nodes) under {}", detail::to_string ( root->id ( ) ), sub_tree_.m_nodes.size ( ),
                                detail::to_string ( id_ ) );
        node.add_child ( *root );
        m_nodes.append ( sub_tree_.m_nodes );
    }

    // The ids below and including id_, each id once, in the order given by strategy_.
    [[nodiscard]] std::vector<Q> traverse ( Q const & id_, traversal_strategy strategy_ ) const {
        node_type const start = find ( id_ );
        std::vector<Q> result;
        std::unordered_set<Q> seen;
        auto emit = [ &result, &seen ] ( Q const & id ) {
            if ( seen.insert ( id ).second )
                result.push_back ( id );
        };
        // A node is expanded once, repeated ids add nothing.
        std::unordered_set<Q> expanded;
        auto expand = [ this, &expanded ] ( Q const & id ) {
            if ( not expanded.insert ( id ).second )
                return std::vector<Q>{ };
            return find ( id ).children_ids ( );
        };
        switch ( strategy_ ) {
            case traversal_strategy::pre_order: {
                id_stack<Q> stack;
                stack.push_back ( id_ );
                while ( stack.size ( ) ) {
                    Q const id                  = pop ( stack );
                    std::vector<Q> const children = expand ( id );
                    emit ( id );
                    for ( auto it = children.rbegin ( ); it != children.rend ( ); ++it )
                        stack.push_back ( *it );
                }
            } break;
            case traversal_strategy::post_order: {
                // Reversed node-right-left pre-order.
                std::vector<Q> reversed;
                id_stack<Q> stack;
                stack.push_back ( id_ );
                while ( stack.size ( ) ) {
                    Q const id = pop ( stack );
                    for ( Q const & child : expand ( id ) )
                        stack.push_back ( child );
                    reversed.push_back ( id );
                }
                for ( auto it = reversed.rbegin ( ); it != reversed.rend ( ); ++it )
                    emit ( *it );
            } break;
            case traversal_strategy::in_order: {
                // First child's sub-tree, the node, then each further child followed by its sub-tree.
                struct frame {
                    Q id;
                    std::vector<Q> children;
                    size_type next;
                    bool done;
                };
                std::vector<frame> stack;
                stack.push_back ( frame{ id_, expand ( id_ ), 0, false } );
                while ( stack.size ( ) ) {
                    frame & top = stack.back ( );
                    if ( top.children.empty ( ) ) {
                        emit ( top.id );
                        stack.pop_back ( );
                        continue;
                    }
                    if ( not top.next ) {
                        top.next    = 1;
                        Q const id = top.children.front ( );
                        stack.push_back ( frame{ id, expand ( id ), 0, false } );
                        continue;
                    }
                    if ( not top.done ) {
                        emit ( top.children.front ( ) );
                        emit ( top.id );
                        top.done = true;
                    }
                    if ( top.next < top.children.size ( ) ) {
                        Q const id = top.children[ top.next++ ];
                        emit ( id );
                        stack.push_back ( frame{ id, expand ( id ), 0, false } );
                        continue;
                    }
                    stack.pop_back ( );
                }
            } break;
        }
        return result;
    }

    // The name underlined with '*', then the outline of the tree from the root.
    [[nodiscard]] std::string to_string ( ) const {
        struct frame {
            Q id;
            std::string prefix;
            bool last;
        };
        std::optional<node_type> const root = get_root_node ( );
        if ( not root )
            throw format_error{ "Tree has no root node" };
        std::ostringstream out;
        if ( m_name )
            out << *m_name << '\n' << std::string ( utf8_length ( *m_name ), '*' ) << '\n';
        std::vector<frame> stack;
        bool at_root      = true;
        size_type printed = 0;
        stack.push_back ( frame{ root->id ( ), std::string{ }, true } );
        while ( stack.size ( ) ) {
            frame current = std::move ( stack.back ( ) );
            stack.pop_back ( );
            if ( ++printed > m_nodes.size ( ) )
                throw format_error{ "Node structure below node " + detail::to_string ( root->id ( ) ) + " is not a tree." };
            std::optional<node_type> const node = at_root ? root : m_nodes.get_by_id ( current.id );
            if ( not node )
                throw format_error{ "Node " + detail::to_string ( current.id ) + " not found in the tree." };
            out << current.prefix;
            if ( at_root ) {
                out << *node << '\n';
                at_root = false;
            }
            else if ( current.last ) {
                out << "└── " << *node << '\n';
                current.prefix += "    ";
            }
            else {
                out << "├── " << *node << '\n';
                current.prefix += "│   ";
            }
            std::vector<Q> const children = node->children_ids ( );
            for ( size_type i = children.size ( ); i; --i )
                stack.push_back ( frame{ children[ i - 1 ], current.prefix, children.size ( ) == i } );
        }
        return out.str ( );
    }

    template<typename Stream>
    friend Stream & operator<< ( Stream & out_, tree_base const & tree_ ) {
        out_ << tree_.to_string ( );
        return out_;
    }

    [[nodiscard]] friend bool operator== ( tree_base const & lhs_, tree_base const & rhs_ ) {
        return lhs_.m_name == rhs_.m_name and lhs_.m_nodes == rhs_.m_nodes;
    }
    [[nodiscard]] friend bool operator!= ( tree_base const & lhs_, tree_base const & rhs_ ) { return not( lhs_ == rhs_ ); }

    [[nodiscard]] std::size_t hash ( ) const {
        std::size_t seed = 0;
        boost::hash_combine ( seed, m_name.has_value ( ) );
        if ( m_name )
            boost::hash_combine ( seed, std::hash<std::string>{ }( *m_name ) );
        for ( node_type const & node : m_nodes )
            boost::hash_combine ( seed, node.hash ( ) );
        return seed;
    }

    private:
    [[nodiscard]] node_type find ( Q const & id_ ) const {
        std::optional<node_type> node = m_nodes.get_by_id ( id_ );
        if ( not node )
            throw node_not_found{ detail::to_string ( id_ ) };
        return std::move ( *node );
    }

    std::optional<std::string> m_name;
    nodes_type m_nodes;
    mutable mutex m_mutex;
};

} // namespace detail

template<typename Q, typename T>
using tree = detail::tree_base<Q, T, false>;

// A detached fragment of a tree, its first node is the root of the fragment.
template<typename Q, typename T>
using sub_tree = detail::tree_base<Q, T, false>;

template<typename Q, typename T>
using concurrent_tree = detail::tree_base<Q, T, true>;

} // namespace tree_ds

namespace std {
template<typename Q, typename T, bool Concurrent>
struct hash<tree_ds::detail::tree_base<Q, T, Concurrent>> {
    [[nodiscard]] std::size_t operator( ) ( tree_ds::detail::tree_base<Q, T, Concurrent> const & tree_ ) const { return tree_.hash ( ); }
};
} // namespace std
