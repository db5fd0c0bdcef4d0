#ifndef DOCUMENT_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
#define DOCUMENT_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17

#if defined(_MSC_VER) || (defined(__GNUC__) && (__GNUC__ == 3 && __GNUC_MINOR__ >= 4) || (__GNUC__ >= 4)) // GCC supports "pragma once" correctly since 3.4
#pragma once
#endif

#include "ytree/dll.h"
#include "ytree/directives.h"
#include "ytree/mark.h"
#include "ytree/node.h"
#include "ytree/style.h"
#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace YTree
{
	// AnchorTable
	// . Name -> node for lookups (the last definition of a name wins),
	//   and node -> name as it was declared, kept for every anchored node.
	class YTREE_API AnchorTable
	{
	public:
		void Bind(const std::string& name, const Node& node);
		void Unbind(const Node& node);
		const Node *Find(const std::string& name) const;

		// NameOf
		// . The name 'node' was declared with, or "" if it never was anchored.
		const std::string NameOf(const Node& node) const;
		bool IsAnchored(const Node& node) const { return m_names.find(&node) != m_names.end(); }

		bool empty() const { return m_names.empty(); }
		std::size_t size() const { return m_names.size(); }
		void clear();

	private:
		std::map<std::string, const Node *> m_bindings;
		std::map<const Node *, std::string> m_names;
		std::map<std::string, std::vector<const Node *> > m_declarations;
	};

	// Document
	// . Owns every node created through it. Moving a document keeps the
	//   nodes where they are, so pointers into it stay good.
	class YTREE_API Document
	{
	public:
		Document();
		Document(Document&& rhs);
		Document& operator = (Document&& rhs);
		~Document();

		Node& CreateScalar(const std::string& value, const std::string& tag = "?", ScalarStyle::value style = ScalarStyle::Any, const Mark& mark = Mark());
		Node& CreateSequence(const std::string& tag = "?", CollectionStyle::value style = CollectionStyle::Any, const Mark& mark = Mark());
		Node& CreateMapping(const std::string& tag = "?", CollectionStyle::value style = CollectionStyle::Any, const Mark& mark = Mark());
		Node& CreateAlias(const Node& target, const Mark& mark = Mark());

		Node *Root() { return m_pRoot; }
		const Node *Root() const { return m_pRoot; }
		void SetRoot(Node *pRoot) { m_pRoot = pRoot; }

		void SetAnchor(const Node& node, const std::string& name);
		void ClearAnchor(const Node& node);
		const AnchorTable& Anchors() const { return m_anchors; }

		// directives
		const Directives& GetDirectives() const { return m_directives; }
		void SetDirectives(const Directives& directives) { m_directives = directives; }
		void SetVersion(int major, int minor);
		void AddTagDirective(const std::string& handle, const std::string& prefix);

		bool HasExplicitStart() const { return m_explicitStart; }
		void SetExplicitStart(bool value) { m_explicitStart = value; }
		bool HasExplicitEnd() const { return m_explicitEnd; }
		void SetExplicitEnd(bool value) { m_explicitEnd = value; }

		std::size_t NodeCount() const { return m_nodes.size(); }

	private:
		Document(const Document&);
		Document& operator = (const Document&);

		Node& Create(NodeType::value type, const Mark& mark, const std::string& tag);

	private:
		std::vector<std::unique_ptr<Node> > m_nodes;
		Node *m_pRoot;
		AnchorTable m_anchors;
		Directives m_directives;
		bool m_explicitStart, m_explicitEnd;
	};

	YTREE_API bool StructurallyEqual(const Document& lhs, const Document& rhs, bool compareStyles = false);
}

#endif // DOCUMENT_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
