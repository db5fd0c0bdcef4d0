#include "nodeevents.h"
#include "ytree/document.h"
#include "ytree/eventhandler.h"
#include "ytree/exceptions.h"
#include "ytree/log.h"
#include <fmt/format.h>

namespace YTree
{
	const std::string NodeEvents::AliasManager::RegisterReference(const Node& node)
	{
		std::string name = m_anchors.NameOf(node);
		if(name.empty())
			name = _CreateNewAnchor();

		m_anchorByIdentity[&node] = name;
		m_nodeByAnchor[name] = &node;
		m_open.insert(&node);
		return name;
	}

	const std::string NodeEvents::AliasManager::LookupAnchor(const Node& node) const
	{
		AnchorByIdentity::const_iterator it = m_anchorByIdentity.find(&node);
		if(it == m_anchorByIdentity.end())
			return "";
		return it->second;
	}

	const Node *NodeEvents::AliasManager::BoundNode(const std::string& name) const
	{
		std::map<std::string, const Node *>::const_iterator it = m_nodeByAnchor.find(name);
		return it == m_nodeByAnchor.end() ? 0 : it->second;
	}

	// _CreateNewAnchor
	// . "alias1", "alias2", ... skipping names the document already uses.
	const std::string NodeEvents::AliasManager::_CreateNewAnchor()
	{
		while(true) {
			const std::string name = fmt::format("alias{}", ++m_curAnchor);
			if(!m_anchors.Find(name) && !BoundNode(name))
				return name;
		}
	}

	NodeEvents::NodeEvents(const Document& document): m_document(document)
	{
		if(const Node *pRoot = m_document.Root())
			Setup(*pRoot);
	}

	// Setup
	// . Counts the references to every node; an alias counts as one more
	//   reference to its target.
	void NodeEvents::Setup(const Node& node)
	{
		if(node.IsAlias()) {
			if(node.Target())
				m_refCount[node.Target()]++;
			return;
		}

		std::size_t& refCount = m_refCount[&node];
		refCount++;
		if(refCount > 1)
			return;

		if(node.Type() == NodeType::Sequence) {
			for(Node::node_seq::const_iterator it=node.Entries().begin();it!=node.Entries().end();++it)
				Setup(**it);
		} else if(node.Type() == NodeType::Map) {
			for(Node::node_map::const_iterator it=node.Pairs().begin();it!=node.Pairs().end();++it) {
				Setup(*it->first);
				Setup(*it->second);
			}
		}
	}

	void NodeEvents::Emit(EventHandler& handler, bool forceExplicitStart)
	{
		AliasManager am(m_document.Anchors());
		const Node *pRoot = m_document.Root();

		const bool isExplicit = forceExplicitStart || m_document.HasExplicitStart() || !pRoot;
		handler.OnDocumentStart(Mark(), m_document.GetDirectives(), isExplicit);
		if(pRoot)
			Emit(*pRoot, handler, am);
		handler.OnDocumentEnd(Mark(), m_document.HasExplicitEnd());
	}

	void NodeEvents::Emit(const Node& node, EventHandler& handler, AliasManager& am) const
	{
		if(node.IsAlias()) {
			if(!node.Target())
				throw EmitError(EmitError::InvalidAlias, ErrorMsg::ALIAS_NOT_WRITTEN + node.Scalar());
			EmitAlias(*node.Target(), handler, am);
			return;
		}

		// reached again: the node itself is shared
		if(!am.LookupAnchor(node).empty()) {
			EmitAlias(node, handler, am);
			return;
		}

		std::string anchor;
		if(IsAliased(node) || m_document.Anchors().IsAnchored(node)) {
			anchor = am.RegisterReference(node);
			ytree_log.trace("anchoring node from line {} as '{}'", node.GetMark().line + 1, anchor);
		}

		switch(node.Type()) {
			case NodeType::Scalar:
				handler.OnScalar(Mark(), node.Tag(), anchor, node.Scalar(), node.GetScalarStyle());
				break;
			case NodeType::Sequence:
				handler.OnSequenceStart(Mark(), node.Tag(), anchor, node.size() == 0 ? CollectionStyle::Flow : node.GetCollectionStyle());
				for(Node::node_seq::const_iterator it=node.Entries().begin();it!=node.Entries().end();++it)
					Emit(**it, handler, am);
				handler.OnSequenceEnd(Mark());
				break;
			case NodeType::Map:
				handler.OnMapStart(Mark(), node.Tag(), anchor, node.size() == 0 ? CollectionStyle::Flow : node.GetCollectionStyle());
				for(Node::node_map::const_iterator it=node.Pairs().begin();it!=node.Pairs().end();++it) {
					Emit(*it->first, handler, am);
					Emit(*it->second, handler, am);
				}
				handler.OnMapEnd(Mark());
				break;
			default:
				break;
		}

		am.Close(node);
	}

	// EmitAlias
	// . The target has to be complete, and its name must still refer to it.
	void NodeEvents::EmitAlias(const Node& target, EventHandler& handler, const AliasManager& am) const
	{
		const std::string name = am.LookupAnchor(target);
		if(name.empty() || am.IsOpen(target))
			throw EmitError(EmitError::InvalidAlias, ErrorMsg::ALIAS_NOT_WRITTEN + (name.empty() ? m_document.Anchors().NameOf(target) : name));
		if(am.BoundNode(name) != &target)
			throw EmitError(EmitError::AnchorCollision, ErrorMsg::ANCHOR_COLLISION + name);

		handler.OnAlias(Mark(), name);
	}

	bool NodeEvents::IsAliased(const Node& node) const
	{
		RefCount::const_iterator it = m_refCount.find(&node);
		return it != m_refCount.end() && it->second > 1;
	}
}
