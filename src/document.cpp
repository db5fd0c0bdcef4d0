#include "ytree/document.h"
#include <algorithm>

namespace YTree
{
	void AnchorTable::Bind(const std::string& name, const Node& node)
	{
		Unbind(node);
		m_bindings[name] = &node;
		m_names[&node] = name;
		m_declarations[name].push_back(&node);
	}

	// Unbind
	// . Forgets the node's declaration. Its name goes back to the
	//   latest other node declared with it, if there is one.
	void AnchorTable::Unbind(const Node& node)
	{
		std::map<const Node *, std::string>::iterator it = m_names.find(&node);
		if(it == m_names.end())
			return;

		const std::string name = it->second;
		m_names.erase(it);

		std::vector<const Node *>& declared = m_declarations[name];
		declared.erase(std::remove(declared.begin(), declared.end(), &node), declared.end());
		if(declared.empty()) {
			m_declarations.erase(name);
			m_bindings.erase(name);
		} else {
			m_bindings[name] = declared.back();
		}
	}

	const Node *AnchorTable::Find(const std::string& name) const
	{
		std::map<std::string, const Node *>::const_iterator it = m_bindings.find(name);
		return it == m_bindings.end() ? 0 : it->second;
	}

	const std::string AnchorTable::NameOf(const Node& node) const
	{
		std::map<const Node *, std::string>::const_iterator it = m_names.find(&node);
		return it == m_names.end() ? std::string() : it->second;
	}

	void AnchorTable::clear()
	{
		m_bindings.clear();
		m_names.clear();
		m_declarations.clear();
	}

	Document::Document(): m_pRoot(0), m_explicitStart(false), m_explicitEnd(false)
	{
	}

	Document::Document(Document&& rhs)
		: m_nodes(std::move(rhs.m_nodes)), m_pRoot(rhs.m_pRoot), m_anchors(std::move(rhs.m_anchors)),
		m_directives(rhs.m_directives), m_explicitStart(rhs.m_explicitStart), m_explicitEnd(rhs.m_explicitEnd)
	{
		rhs.m_pRoot = 0;
		rhs.m_anchors.clear();
	}

	Document& Document::operator = (Document&& rhs)
	{
		if(this == &rhs)
			return *this;

		m_nodes = std::move(rhs.m_nodes);
		m_pRoot = rhs.m_pRoot;
		m_anchors = std::move(rhs.m_anchors);
		m_directives = rhs.m_directives;
		m_explicitStart = rhs.m_explicitStart;
		m_explicitEnd = rhs.m_explicitEnd;

		rhs.m_pRoot = 0;
		rhs.m_anchors.clear();
		return *this;
	}

	Document::~Document()
	{
	}

	Node& Document::Create(NodeType::value type, const Mark& mark, const std::string& tag)
	{
		m_nodes.push_back(std::unique_ptr<Node>(new Node(type, mark, tag)));
		return *m_nodes.back();
	}

	Node& Document::CreateScalar(const std::string& value, const std::string& tag, ScalarStyle::value style, const Mark& mark)
	{
		Node& node = Create(NodeType::Scalar, mark, tag);
		node.m_scalarData = value;
		node.m_scalarStyle = style;
		return node;
	}

	Node& Document::CreateSequence(const std::string& tag, CollectionStyle::value style, const Mark& mark)
	{
		Node& node = Create(NodeType::Sequence, mark, tag);
		node.m_collectionStyle = style;
		return node;
	}

	Node& Document::CreateMapping(const std::string& tag, CollectionStyle::value style, const Mark& mark)
	{
		Node& node = Create(NodeType::Map, mark, tag);
		node.m_collectionStyle = style;
		return node;
	}

	// CreateAlias
	// . The alias takes the target's declared anchor name, if it has one.
	Node& Document::CreateAlias(const Node& target, const Mark& mark)
	{
		Node& node = Create(NodeType::Alias, mark, "");
		node.m_pTarget = &target.Deref();
		node.m_scalarData = m_anchors.NameOf(*node.m_pTarget);
		return node;
	}

	void Document::SetAnchor(const Node& node, const std::string& name)
	{
		m_anchors.Bind(name, node);
	}

	void Document::ClearAnchor(const Node& node)
	{
		m_anchors.Unbind(node);
	}

	void Document::SetVersion(int major, int minor)
	{
		m_directives.version.isDefault = false;
		m_directives.version.major = major;
		m_directives.version.minor = minor;
	}

	void Document::AddTagDirective(const std::string& handle, const std::string& prefix)
	{
		m_directives.tags[handle] = prefix;
	}

	bool StructurallyEqual(const Document& lhs, const Document& rhs, bool compareStyles)
	{
		if(!lhs.Root() || !rhs.Root())
			return !lhs.Root() && !rhs.Root();
		return StructurallyEqual(*lhs.Root(), *rhs.Root(), compareStyles);
	}
}
