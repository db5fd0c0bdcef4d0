#ifndef NODE_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
#define NODE_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17

#if defined(_MSC_VER) || (defined(__GNUC__) && (__GNUC__ == 3 && __GNUC_MINOR__ >= 4) || (__GNUC__ >= 4)) // GCC supports "pragma once" correctly since 3.4
#pragma once
#endif

#include "ytree/dll.h"
#include "ytree/mark.h"
#include "ytree/noncopyable.h"
#include "ytree/style.h"
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace YTree
{
	class Document;

	struct NodeType { enum value { Scalar, Sequence, Map, Alias }; };

	// Node
	// . Lives in the arena of the Document that created it.
	// . The tag is kept as written: "?" (none given), "!" (non-specific),
	//   or the resolved tag. ResolvedTag() applies the core schema.
	class YTREE_API Node: private noncopyable
	{
	public:
		friend class Document;

		typedef std::vector<Node *> node_seq;
		typedef std::vector<std::pair<Node *, Node *> > node_map;

		~Node();

		NodeType::value Type() const { return m_type; }
		bool IsAlias() const { return m_type == NodeType::Alias; }

		// file location of start of this node
		const Mark GetMark() const { return m_mark; }

		// for tags
		const std::string& Tag() const { return m_tag; }
		void SetTag(const std::string& tag) { m_tag = tag; }
		const std::string ResolvedTag() const;

		// scalars (for an alias, the name it was written with)
		const std::string& Scalar() const { return m_scalarData; }
		ScalarStyle::value GetScalarStyle() const { return m_scalarStyle; }
		void SetScalarStyle(ScalarStyle::value style) { m_scalarStyle = style; }

		// collections
		CollectionStyle::value GetCollectionStyle() const { return m_collectionStyle; }
		void SetCollectionStyle(CollectionStyle::value style) { m_collectionStyle = style; }
		std::size_t size() const;

		const node_seq& Entries() const { return m_seqData; }
		const node_map& Pairs() const { return m_mapData; }

		// FindValue
		// . Map lookup by scalar key text, or NULL.
		const Node *FindValue(const std::string& key) const;

		void Append(Node& node);
		void Insert(Node& key, Node& value);

		// Remove
		// . Drops the pair whose key is exactly 'key'.
		void Remove(const Node& key);

		// aliases
		const Node *Target() const { return m_pTarget; }

		// Deref
		// . The node itself, or for an alias the node it refers to.
		const Node& Deref() const { return m_pTarget ? *m_pTarget : *this; }

	private:
		Node(NodeType::value type, const Mark& mark, const std::string& tag);

	private:
		NodeType::value m_type;
		Mark m_mark;
		std::string m_tag;

		std::string m_scalarData;
		ScalarStyle::value m_scalarStyle;
		CollectionStyle::value m_collectionStyle;
		node_seq m_seqData;
		node_map m_mapData;
		const Node *m_pTarget;
	};

	// StructurallyEqual
	// . Same kinds, resolved tags, scalar text and alias topology.
	//   Styles only count when 'compareStyles' is set.
	YTREE_API bool StructurallyEqual(const Node& lhs, const Node& rhs, bool compareStyles = false);
}

#endif // NODE_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
