
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
#include <initializer_list>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "node.hpp"

namespace tree_ds {
namespace detail {

// An ordered collection of node handles, looked up by position or by id.
template<typename Q, typename T, bool Concurrent = false>
class nodes_base {

    public:
    using is_concurrent = std::integral_constant<bool, Concurrent>;
    using node_type     = node_base<Q, T, Concurrent>;

    private:
    using data = std::vector<node_type>;

    public:
    using size_type       = std::size_t;
    using value_type      = node_type;
    using reference       = typename data::reference;
    using const_reference = typename data::const_reference;
    using iterator        = typename data::iterator;
    using const_iterator  = typename data::const_iterator;

    nodes_base ( ) = default;

    template<typename It>
    nodes_base ( It first_, It last_ ) : m_nodes ( first_, last_ ) {}

    nodes_base ( std::initializer_list<node_type> nodes_ ) : m_nodes ( nodes_ ) {}

    explicit nodes_base ( data && nodes_ ) noexcept : m_nodes ( std::move ( nodes_ ) ) {}

    [[nodiscard]] const_iterator begin ( ) const noexcept { return m_nodes.begin ( ); }
    [[nodiscard]] const_iterator cbegin ( ) const noexcept { return m_nodes.cbegin ( ); }
    [[nodiscard]] iterator begin ( ) noexcept { return m_nodes.begin ( ); }
    [[nodiscard]] const_iterator end ( ) const noexcept { return m_nodes.end ( ); }
    [[nodiscard]] const_iterator cend ( ) const noexcept { return m_nodes.cend ( ); }
    [[nodiscard]] iterator end ( ) noexcept { return m_nodes.end ( ); }

    [[nodiscard]] size_type size ( ) const noexcept { return m_nodes.size ( ); }
    [[nodiscard]] bool empty ( ) const noexcept { return m_nodes.empty ( ); }

    void push ( node_type node_ ) { m_nodes.push_back ( std::move ( node_ ) ); }

    // Takes out the node at index_. Throws std::out_of_range if index_ is not a position in the collection.
    [[maybe_unused]] node_type remove ( size_type index_ ) {
        if ( index_ >= m_nodes.size ( ) )
            throw std::out_of_range{ "node index " + std::to_string ( index_ ) + " out of range" };
        auto const it     = m_nodes.begin ( ) + static_cast<typename data::difference_type> ( index_ );
        node_type removed = std::move ( *it );
        m_nodes.erase ( it );
        return removed;
    }

    // Keeps the nodes for which predicate_ holds, in order.
    template<typename Predicate>
    void retain ( Predicate predicate_ ) {
        m_nodes.erase ( std::remove_if ( m_nodes.begin ( ), m_nodes.end ( ),
                                         [ &predicate_ ] ( node_type const & node_ ) { return not predicate_ ( node_ ); } ),
                        m_nodes.end ( ) );
    }

    [[nodiscard]] std::optional<node_type> get ( size_type index_ ) const {
        if ( index_ < m_nodes.size ( ) )
            return m_nodes[ index_ ];
        return std::nullopt;
    }

    // The first node with id id_.
    [[nodiscard]] std::optional<node_type> get_by_id ( Q const & id_ ) const {
        for ( node_type const & node : m_nodes )
            if ( node.id ( ) == id_ )
                return node;
        return std::nullopt;
    }

    [[nodiscard]] std::optional<node_type> first ( ) const { return get ( 0 ); }

    // Moves all nodes of other_ to the back, other_ is left empty.
    void append ( nodes_base & other_ ) { append_raw ( other_.m_nodes ); }

    void append_raw ( data & other_ ) {
        m_nodes.insert ( m_nodes.end ( ), std::make_move_iterator ( other_.begin ( ) ), std::make_move_iterator ( other_.end ( ) ) );
        other_.clear ( );
    }

    void clear ( ) noexcept { m_nodes.clear ( ); }

    [[nodiscard]] friend bool operator== ( nodes_base const & lhs_, nodes_base const & rhs_ ) { return lhs_.m_nodes == rhs_.m_nodes; }
    [[nodiscard]] friend bool operator!= ( nodes_base const & lhs_, nodes_base const & rhs_ ) { return not( lhs_ == rhs_ ); }

    template<typename Stream>
    friend Stream & operator<< ( Stream & out_, nodes_base const & nodes_ ) {
        for ( node_type const & node : nodes_ )
            out_ << node;
        return out_;
    }

    private:
    data m_nodes;
};

} // namespace detail

template<typename Q, typename T>
using nodes = detail::nodes_base<Q, T, false>;

template<typename Q, typename T>
using concurrent_nodes = detail::nodes_base<Q, T, true>;

} // namespace tree_ds
