
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

#include <cstddef>
#include <cstring>
#include <optional>
#include <sstream>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include <cereal/cereal.hpp>
#include <cereal/archives/json.hpp>
#include <cereal/types/optional.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>

#include "logging.hpp"
#include "tree.hpp"

namespace tree_ds {

// Full records carry the children lists, compact records rebuild them from the parents.
enum class record_form { full, compact };

namespace detail {

// Json writes an absent optional as null, other archives use cereal's optional encoding.
template<class Archive, typename V>
void save_nullable ( Archive & ar_, char const * name_, std::optional<V> const & value_ ) {
    if constexpr ( std::is_same<Archive, cereal::JSONOutputArchive>::value ) {
        if ( value_ ) {
            ar_ ( cereal::make_nvp ( name_, *value_ ) );
        }
        else {
            std::nullptr_t const null = nullptr;
            ar_ ( cereal::make_nvp ( name_, null ) );
        }
    }
    else {
        ar_ ( cereal::make_nvp ( name_, value_ ) );
    }
}

// JSONInputArchive has no null check, reading a null that is not there throws and leaves the
// archive on the member.
template<class Archive, typename V>
void load_nullable ( Archive & ar_, char const * name_, std::optional<V> & value_ ) {
    if constexpr ( std::is_same<Archive, cereal::JSONInputArchive>::value ) {
        try {
            std::nullptr_t null = nullptr;
            ar_ ( cereal::make_nvp ( name_, null ) );
            value_.reset ( );
            return;
        }
        catch ( cereal::RapidJSONException const & ) {
        }
        V value{ };
        ar_ ( cereal::make_nvp ( name_, value ) );
        value_ = std::move ( value );
    }
    else {
        ar_ ( cereal::make_nvp ( name_, value_ ) );
    }
}

template<typename Q, typename T, record_form Form>
struct node_entry {
    Q node_id{ };
    std::optional<T> value;
    std::vector<Q> children;
    std::optional<Q> parent;

    template<class Archive>
    void save ( Archive & ar_ ) const {
        ar_ ( cereal::make_nvp ( "node_id", node_id ) );
        save_nullable ( ar_, "value", value );
        if constexpr ( record_form::full == Form )
            ar_ ( cereal::make_nvp ( "children", children ) );
        save_nullable ( ar_, "parent", parent );
    }

    template<class Archive>
    void load ( Archive & ar_ ) {
        ar_ ( cereal::make_nvp ( "node_id", node_id ) );
        load_nullable ( ar_, "value", value );
        if constexpr ( record_form::full == Form )
            ar_ ( cereal::make_nvp ( "children", children ) );
        load_nullable ( ar_, "parent", parent );
    }
};

template<record_form Form, typename Q, typename T, bool Concurrent>
[[nodiscard]] node_entry<Q, T, Form> make_entry ( node_base<Q, T, Concurrent> const & node_ ) {
    node_entry<Q, T, Form> entry;
    entry.node_id = node_.id ( );
    entry.value   = node_.value ( );
    if constexpr ( record_form::full == Form )
        entry.children = node_.children_ids ( );
    entry.parent = node_.parent_id ( );
    return entry;
}

template<typename Tree>
class tree_record {

    using tree_type = std::remove_const_t<Tree>;
    using Q         = typename tree_type::id_type;
    using T         = typename tree_type::value_type;
    using node_type = typename tree_type::node_type;

    public:
    tree_record ( Tree & tree_, record_form form_ ) noexcept : m_tree{ tree_ }, m_form{ form_ } {}

    template<class Archive>
    void save ( Archive & ar_ ) const {
        save_name ( ar_ );
        if ( record_form::full == m_form )
            save_nodes<record_form::full> ( ar_ );
        else
            save_nodes<record_form::compact> ( ar_ );
    }

    template<class Archive>
    void load ( Archive & ar_ ) {
        std::optional<std::string> name = load_name ( ar_ );
        nodes_base<Q, T, tree_type::is_concurrent::value> nodes =
            record_form::full == m_form ? load_full ( ar_ ) : load_compact ( ar_ );
        m_tree = tree_type{ std::move ( name ), std::move ( nodes ) };
    }

    private:
    // Json leaves an absent name out, other archives store the optional.
    template<class Archive>
    void save_name ( Archive & ar_ ) const {
        if constexpr ( std::is_same<Archive, cereal::JSONOutputArchive>::value ) {
            if ( m_tree.name ( ) )
                ar_ ( cereal::make_nvp ( "name", *m_tree.name ( ) ) );
        }
        else {
            ar_ ( cereal::make_nvp ( "name", m_tree.name ( ) ) );
        }
    }

    template<class Archive>
    [[nodiscard]] std::optional<std::string> load_name ( Archive & ar_ ) {
        std::optional<std::string> name;
        if constexpr ( std::is_same<Archive, cereal::JSONInputArchive>::value ) {
            char const * next = ar_.getNodeName ( );
            if ( next and 0 == std::strcmp ( next, "name" ) )
                load_nullable ( ar_, "name", name );
        }
        else {
            ar_ ( cereal::make_nvp ( "name", name ) );
        }
        return name;
    }

    template<record_form Form, class Archive>
    void save_nodes ( Archive & ar_ ) const {
        std::vector<node_entry<Q, T, Form>> entries;
        entries.reserve ( m_tree.get_nodes ( ).size ( ) );
        for ( node_type const & node : m_tree.get_nodes ( ) )
            entries.push_back ( make_entry<Form> ( node ) );
        ar_ ( cereal::make_nvp ( "nodes", entries ) );
    }

    template<class Archive>
    [[nodiscard]] nodes_base<Q, T, tree_type::is_concurrent::value> load_full ( Archive & ar_ ) {
        std::vector<node_entry<Q, T, record_form::full>> entries;
        ar_ ( cereal::make_nvp ( "nodes", entries ) );
        nodes_base<Q, T, tree_type::is_concurrent::value> nodes;
        for ( auto & entry : entries )
            nodes.push ( node_type{ std::move ( entry.node_id ), std::move ( entry.value ), std::move ( entry.children ),
                                    std::move ( entry.parent ) } );
        return nodes;
    }

    // Children are re-linked in record order, a parent id that names no record is kept as is.
    template<class Archive>
    [[nodiscard]] nodes_base<Q, T, tree_type::is_concurrent::value> load_compact ( Archive & ar_ ) {
        std::vector<node_entry<Q, T, record_form::compact>> entries;
        ar_ ( cereal::make_nvp ( "nodes", entries ) );
        std::vector<node_type> nodes;
        nodes.reserve ( entries.size ( ) );
        std::unordered_map<Q, std::size_t> index;
        for ( auto & entry : entries ) {
            index.emplace ( entry.node_id, nodes.size ( ) );
            nodes.emplace_back ( std::move ( entry.node_id ), std::move ( entry.value ), std::vector<Q>{ }, std::move ( entry.parent ) );
        }
        for ( node_type const & node : nodes ) {
            std::optional<Q> const parent_id = node.parent_id ( );
            if ( not parent_id )
                continue;
            auto const parent = index.find ( *parent_id );
            if ( index.end ( ) == parent ) {
                logger ( )->warn ( "node {} refers to parent {}, which is not in the record", detail::to_string ( node.id ( ) ),
                                   detail::to_string ( *parent_id ) );
                continue;
            }
            nodes[ parent->second ].add_child ( node );
        }
        return nodes_base<Q, T, tree_type::is_concurrent::value> ( std::move ( nodes ) );
    }

    Tree & m_tree;
    record_form m_form;
};

// A tree serializes in full form.
template<class Archive, typename Q, typename T, bool Concurrent>
void save ( Archive & ar_, tree_base<Q, T, Concurrent> const & tree_ ) {
    tree_record<tree_base<Q, T, Concurrent> const>{ tree_, record_form::full }.save ( ar_ );
}

template<class Archive, typename Q, typename T, bool Concurrent>
void load ( Archive & ar_, tree_base<Q, T, Concurrent> & tree_ ) {
    tree_record<tree_base<Q, T, Concurrent>>{ tree_, record_form::full }.load ( ar_ );
}

// A standalone node serializes as one full entry, links included.
template<class Archive, typename Q, typename T, bool Concurrent>
void save ( Archive & ar_, node_base<Q, T, Concurrent> const & node_ ) {
    make_entry<record_form::full> ( node_ ).save ( ar_ );
}

// Replaces node_ with a new record, other handles keep the old one.
template<class Archive, typename Q, typename T, bool Concurrent>
void load ( Archive & ar_, node_base<Q, T, Concurrent> & node_ ) {
    node_entry<Q, T, record_form::full> entry;
    entry.load ( ar_ );
    node_ = node_base<Q, T, Concurrent>{ std::move ( entry.node_id ), std::move ( entry.value ), std::move ( entry.children ),
                                         std::move ( entry.parent ) };
}

template<class Archive, typename Q, typename T, bool Concurrent>
void save ( Archive & ar_, nodes_base<Q, T, Concurrent> const & nodes_ ) {
    std::vector<node_entry<Q, T, record_form::full>> entries;
    entries.reserve ( nodes_.size ( ) );
    for ( node_base<Q, T, Concurrent> const & node : nodes_ )
        entries.push_back ( make_entry<record_form::full> ( node ) );
    ar_ ( cereal::make_nvp ( "nodes", entries ) );
}

template<class Archive, typename Q, typename T, bool Concurrent>
void load ( Archive & ar_, nodes_base<Q, T, Concurrent> & nodes_ ) {
    std::vector<node_entry<Q, T, record_form::full>> entries;
    ar_ ( cereal::make_nvp ( "nodes", entries ) );
    std::vector<node_base<Q, T, Concurrent>> nodes;
    nodes.reserve ( entries.size ( ) );
    for ( auto & entry : entries )
        nodes.emplace_back ( std::move ( entry.node_id ), std::move ( entry.value ), std::move ( entry.children ),
                             std::move ( entry.parent ) );
    nodes_ = nodes_base<Q, T, Concurrent> ( std::move ( nodes ) );
}

} // namespace detail

// Serializes tree_ in the given form with any cereal archive: archive ( make_record ( tree, form ) ).
template<typename Tree>
[[nodiscard]] detail::tree_record<Tree> make_record ( Tree & tree_, record_form form_ = record_form::full ) noexcept {
    return detail::tree_record<Tree>{ tree_, form_ };
}

// The json text of tree_, name and nodes at the top level.
template<typename Tree>
[[nodiscard]] std::string to_json ( Tree const & tree_, record_form form_ = record_form::full ) {
    std::ostringstream stream;
    {
        cereal::JSONOutputArchive archive ( stream, cereal::JSONOutputArchive::Options::NoIndent ( ) );
        make_record ( tree_, form_ ).save ( archive );
    }
    return stream.str ( );
}

// Throws cereal::Exception on malformed input.
template<typename Tree>
[[nodiscard]] Tree from_json ( std::string const & json_, record_form form_ = record_form::full ) {
    std::istringstream stream ( json_ );
    Tree tree;
    {
        cereal::JSONInputArchive archive ( stream );
        make_record ( tree, form_ ).load ( archive );
    }
    return tree;
}

} // namespace tree_ds
