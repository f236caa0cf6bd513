#pragma once

#include "cpak/document/document.h"

#include <concepts>
#include <string_view>

namespace cpak::document {

/**
 * HierarchyVisitor concept: the capability the walker drives over a
 * document tree.
 *
 * visit_node() is called once per node, parent before children. Whatever it
 * returns is handed to each child of that node as the inherited context, so
 * per-level state (key prefixes, depth, ...) flows downward without the
 * visitor keeping a stack of its own.
 *
 * The visitor may mutate the node it is given, including resolving
 * reference entries into inline documents; the walker descends into the
 * slots as they are after visit_node() returns.
 */
template <typename T>
concept HierarchyVisitor = requires(
    T v,
    Document& doc,
    std::string_view collection,
    const typename T::context_type& context)
{
    typename T::context_type;

    {
        v.visit_node(doc, collection, context)
    }
    ->std::convertible_to<typename T::context_type>;
};

/**
 * Walk a document and every inline embedded document below it, pre-order.
 *
 * Slots are visited in schema order; entries of a collection-valued slot in
 * sequence order. Reference entries that are still unresolved after the
 * parent was visited are not descended into.
 */
template <HierarchyVisitor Visitor>
void
walk_hierarchy(
    Document& doc,
    Visitor& visitor,
    const typename Visitor::context_type& context = {})
{
    typename Visitor::context_type next =
        visitor.visit_node(doc, doc.collection(), context);

    for (auto& slot : doc.slots())
    {
        for (auto& entry : slot.entries)
        {
            if (entry.is_inline())
                walk_hierarchy(entry.document(), visitor, next);
        }
    }
}

}  // namespace cpak::document
