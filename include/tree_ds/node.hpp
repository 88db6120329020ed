
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
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/container_hash/hash.hpp>

#include "config.hpp"
#include "error.hpp"
#include "id_generator.hpp"
#include "detail/cell.hpp"

namespace tree_ds {
namespace detail {

// The shared state behind node handles. Relatives are referred to by id only.
template<typename Q, typename T, bool Concurrent>
struct node_record {

    node_record ( Q id_, std::optional<T> value_, std::vector<Q> children_, std::optional<Q> parent_ ) :
        id{ std::move ( id_ ) }, value{ std::move ( value_ ) }, children{ std::move ( children_ ) }, parent{ std::move ( parent_ ) } {}

    Q const id; // Immutable, read without taking the guard.
    std::optional<T> value;
    std::vector<Q> children;
    std::optional<Q> parent;

    mutable cell<Concurrent> guard;
};

template<typename Q, typename T, bool Concurrent = false>
class node_base {

    using record = node_record<Q, T, Concurrent>;

    public:
    using is_concurrent  = std::integral_constant<bool, Concurrent>;
    using id_type        = Q;
    using value_type     = T;
    using optional_value = std::optional<T>;
    using children_type  = std::vector<Q>;
    using cell_type      = cell<Concurrent>;

    private:
    using read_lock  = std::shared_lock<cell_type>;
    using write_lock = std::unique_lock<cell_type>;

    public:
    explicit node_base ( Q id_, std::optional<T> value_ = std::nullopt ) :
        m_record{ std::make_shared<record> ( std::move ( id_ ), std::move ( value_ ), children_type{ }, std::nullopt ) } {}

    // Restores a node with its links, as read back from an archive.
    node_base ( Q id_, std::optional<T> value_, children_type children_, std::optional<Q> parent_ ) :
        m_record{ std::make_shared<record> ( std::move ( id_ ), std::move ( value_ ), std::move ( children_ ),
                                             std::move ( parent_ ) ) } {}

    // A node with an id drawn from generator_.
    template<typename Convert = id_from<Q>>
    [[nodiscard]] static node_base with_auto_id ( std::optional<T> value_, id_generator & generator_ = default_id_generator ( ),
                                                  Convert convert_ = Convert{ } ) {
        return node_base{ convert_ ( generator_.next ( ) ), std::move ( value_ ) };
    }

    // Handles are shallow, the constness of a handle does not extend to the record.

    [[nodiscard]] Q const & id ( ) const noexcept { return m_record->id; }

    [[nodiscard]] std::optional<T> value ( ) const {
        read_lock lock ( m_record->guard );
        return m_record->value;
    }

    void set_value ( std::optional<T> value_ ) const {
        write_lock lock ( m_record->guard );
        m_record->value = std::move ( value_ );
    }

    // Applies f_ ( std::optional<T> & ) to the value in one critical section. Accessing this
    // node from within f_ throws access_conflict.
    template<typename Function>
    void update_value ( Function && f_ ) const {
        write_lock lock ( m_record->guard );
        std::forward<Function> ( f_ ) ( m_record->value );
    }

    [[nodiscard]] children_type children_ids ( ) const {
        read_lock lock ( m_record->guard );
        return m_record->children;
    }

    [[nodiscard]] std::optional<Q> parent_id ( ) const {
        read_lock lock ( m_record->guard );
        return m_record->parent;
    }

    // Links child_ below this node. Only one record is locked at a time.
    void add_child ( node_base const & child_ ) const {
        if ( m_record == child_.m_record )
            throw access_conflict{ "a node cannot be added as its own child" };
        {
            write_lock lock ( m_record->guard );
            m_record->children.push_back ( child_.id ( ) );
        }
        write_lock lock ( child_.m_record->guard );
        child_.m_record->parent = m_record->id;
    }

    // Removes every occurrence of child_ from the children and clears its parent.
    void remove_child ( node_base const & child_ ) const {
        if ( m_record == child_.m_record )
            throw access_conflict{ "a node cannot be removed as its own child" };
        {
            write_lock lock ( m_record->guard );
            children_type & children = m_record->children;
            children.erase ( std::remove ( children.begin ( ), children.end ( ), child_.id ( ) ), children.end ( ) );
        }
        write_lock lock ( child_.m_record->guard );
        child_.m_record->parent.reset ( );
    }

    void set_parent ( std::optional<node_base> const & parent_ ) const {
        if ( parent_ ) {
            parent_->add_child ( *this );
        }
        else {
            write_lock lock ( m_record->guard );
            m_record->parent.reset ( );
        }
    }

    // Stable sort of the children ids, compare_ runs without any lock held.
    template<typename Compare>
    void sort_children ( Compare compare_ ) const {
        children_type children = children_ids ( );
        std::stable_sort ( children.begin ( ), children.end ( ), compare_ );
        write_lock lock ( m_record->guard );
        m_record->children = std::move ( children );
    }

    // A new record with the same contents.
    [[nodiscard]] node_base duplicate ( ) const {
        read_lock lock ( m_record->guard );
        return node_base{ m_record->id, m_record->value, m_record->children, m_record->parent };
    }

    [[nodiscard]] bool shares_record_with ( node_base const & other_ ) const noexcept { return m_record == other_.m_record; }

    [[nodiscard]] std::size_t hash ( ) const {
        read_lock lock ( m_record->guard );
        std::size_t seed = 0;
        boost::hash_combine ( seed, std::hash<Q>{ }( m_record->id ) );
        boost::hash_combine ( seed, m_record->value.has_value ( ) );
        if ( m_record->value )
            boost::hash_combine ( seed, std::hash<T>{ }( *m_record->value ) );
        boost::hash_combine ( seed, m_record->children.size ( ) );
        for ( Q const & child : m_record->children )
            boost::hash_combine ( seed, std::hash<Q>{ }( child ) );
        boost::hash_combine ( seed, m_record->parent.has_value ( ) );
        if ( m_record->parent )
            boost::hash_combine ( seed, std::hash<Q>{ }( *m_record->parent ) );
        return seed;
    }

    [[nodiscard]] friend bool operator== ( node_base const & lhs_, node_base const & rhs_ ) {
        if ( lhs_.m_record == rhs_.m_record )
            return true;
        return lhs_.id ( ) == rhs_.id ( ) and lhs_.value ( ) == rhs_.value ( );
    }
    [[nodiscard]] friend bool operator!= ( node_base const & lhs_, node_base const & rhs_ ) { return not( lhs_ == rhs_ ); }

    template<typename Stream>
    friend Stream & operator<< ( Stream & out_, node_base const & node_ ) {
        std::optional<T> const value = node_.value ( );
#if TREE_DS_PRINT_NODE_ID
        out_ << node_.id ( ) << ": ";
#endif
        if ( value )
            out_ << *value;
        else
            out_ << T{ };
        return out_;
    }

    private:
    std::shared_ptr<record> m_record;
};

} // namespace detail

template<typename Q, typename T>
using node = detail::node_base<Q, T, false>;

template<typename Q, typename T>
using concurrent_node = detail::node_base<Q, T, true>;

} // namespace tree_ds

namespace std {
template<typename Q, typename T, bool Concurrent>
struct hash<tree_ds::detail::node_base<Q, T, Concurrent>> {
    [[nodiscard]] std::size_t operator( ) ( tree_ds::detail::node_base<Q, T, Concurrent> const & node_ ) const {
        return node_.hash ( );
    }
};
} // namespace std
