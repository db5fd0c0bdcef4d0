#include "ytree/composer.h"
#include "ytree/document.h"
#include "ytree/exceptions.h"
#include "ytree/log.h"
#include "ytree/mark.h"
#include "ytree/node.h"

namespace YTree
{
	Composer::Composer(Document& document, const ComposerOptions& options)
		: m_document(document), m_options(options), m_finished(false), m_expandedTotal(0)
	{
	}

	Composer::~Composer()
	{
	}

	void Composer::OnDocumentStart(const Mark&, const Directives& directives, bool isExplicit)
	{
		m_document.SetDirectives(directives);
		m_document.SetExplicitStart(isExplicit);
	}

	void Composer::OnDocumentEnd(const Mark&, bool isExplicit)
	{
		m_document.SetExplicitEnd(isExplicit);
		m_finished = true;
	}

	void Composer::OnAlias(const Mark& mark, const std::string& name)
	{
		const Node *pTarget = m_document.Anchors().Find(name);
		if(!pTarget)
			throw ComposeError(mark, ComposeError::UndefinedAlias, ErrorMsg::UNKNOWN_ANCHOR + name);

		for(std::size_t i=0;i<m_stack.size();i++) {
			if(m_stack[i].pNode == pTarget)
				throw ComposeError(mark, ComposeError::AliasCycle, ErrorMsg::ALIAS_CYCLE + name);
		}

		m_aliasTargets.insert(pTarget);
		Node& node = m_document.CreateAlias(*pTarget, mark);
		Count(node, m_expandedSizes[pTarget]);
		Insert(node);
	}

	void Composer::OnScalar(const Mark& mark, const std::string& tag, const std::string& anchor, const std::string& value, ScalarStyle::value style)
	{
		Node& node = m_document.CreateScalar(value, tag, style, mark);
		Count(node, 1);
		RegisterAnchor(anchor, node);
		Insert(node);
	}

	void Composer::OnSequenceStart(const Mark& mark, const std::string& tag, const std::string& anchor, CollectionStyle::value style)
	{
		Push(m_document.CreateSequence(tag, style, mark), anchor);
	}

	void Composer::OnSequenceEnd(const Mark&)
	{
		Pop();
	}

	void Composer::OnMapStart(const Mark& mark, const std::string& tag, const std::string& anchor, CollectionStyle::value style)
	{
		Push(m_document.CreateMapping(tag, style, mark), anchor);
	}

	void Composer::OnMapEnd(const Mark&)
	{
		Pop();
	}

	void Composer::Push(Node& node, const std::string& anchor)
	{
		std::size_t start = m_expandedTotal;
		Count(node, 1);
		RegisterAnchor(anchor, node);
		m_stack.push_back(Frame(&node, start));
	}

	// Pop
	// . Closes the innermost collection. Everything counted since it was
	//   opened is its expanded size.
	void Composer::Pop()
	{
		Node& node = *m_stack.back().pNode;
		if(m_document.Anchors().IsAnchored(node))
			m_expandedSizes[&node] = m_expandedTotal - m_stack.back().expandedStart;

		m_stack.pop_back();
		Insert(node);
	}

	void Composer::Insert(Node& node)
	{
		if(m_stack.empty()) {
			m_document.SetRoot(&node);
			return;
		}

		Frame& frame = m_stack.back();
		if(frame.pNode->Type() == NodeType::Sequence) {
			frame.pNode->Append(node);
			return;
		}

		if(!frame.pPendingKey) {
			InsertKey(frame, node);
			return;
		}

		if(frame.dropPair) {
			Discard(*frame.pPendingKey);
			Discard(node);
		} else {
			frame.pNode->Insert(*frame.pPendingKey, node);
		}
		frame.pPendingKey = 0;
		frame.dropPair = false;
	}

	// InsertKey
	// . Holds the key until its value arrives, settling duplicates
	//   by the configured policy.
	void Composer::InsertKey(Frame& frame, Node& key)
	{
		frame.pPendingKey = &key;

		Node *pExisting = FindDuplicate(frame, key);
		if(pExisting) {
			const Node& k = key.Deref();
			const std::string text = k.Type() == NodeType::Scalar ? k.Scalar() : std::string("<collection>");
			switch(m_options.duplicateKeys) {
				case DuplicateKeyPolicy::Fail:
					throw ComposeError(key.GetMark(), ComposeError::DuplicateKey, ErrorMsg::DUPLICATE_KEY);
				case DuplicateKeyPolicy::FirstWins:
					ytree_log.warning("duplicate key '{}' at line {}, column {}: keeping the first value", text, key.GetMark().line + 1, key.GetMark().column + 1);
					frame.dropPair = true;
					return;
				case DuplicateKeyPolicy::LastWins:
					ytree_log.warning("duplicate key '{}' at line {}, column {}: replacing the earlier value", text, key.GetMark().line + 1, key.GetMark().column + 1);
					for(Node::node_map::const_iterator it=frame.pNode->Pairs().begin();it!=frame.pNode->Pairs().end();++it) {
						if(it->first != pExisting)
							continue;
						if(IsAliasTarget(*it->first) || IsAliasTarget(*it->second))
							throw ComposeError(key.GetMark(), ComposeError::DuplicateKey, ErrorMsg::DUPLICATE_KEY_ALIASED);
						Discard(*it->first);
						Discard(*it->second);
						break;
					}
					frame.pNode->Remove(*pExisting);
					break;
			}
		}

		const Node& k = key.Deref();
		if(k.Type() == NodeType::Scalar) {
			frame.scalarKeys[std::make_pair(k.ResolvedTag(), k.Scalar())] = &key;
		} else {
			for(std::size_t i=0;i<frame.otherKeys.size();i++) {
				if(frame.otherKeys[i] == pExisting) {
					frame.otherKeys.erase(frame.otherKeys.begin() + i);
					break;
				}
			}
			frame.otherKeys.push_back(&key);
		}
	}

	Node *Composer::FindDuplicate(Frame& frame, const Node& key) const
	{
		const Node& k = key.Deref();
		if(k.Type() == NodeType::Scalar) {
			std::map<std::pair<std::string, std::string>, Node *>::const_iterator it = frame.scalarKeys.find(std::make_pair(k.ResolvedTag(), k.Scalar()));
			return it == frame.scalarKeys.end() ? 0 : it->second;
		}

		for(std::size_t i=0;i<frame.otherKeys.size();i++) {
			if(StructurallyEqual(k, frame.otherKeys[i]->Deref()))
				return frame.otherKeys[i];
		}
		return 0;
	}

	void Composer::RegisterAnchor(const std::string& anchor, Node& node)
	{
		if(anchor.empty())
			return;

		m_document.SetAnchor(node, anchor);
		if(node.Type() == NodeType::Scalar)
			m_expandedSizes[&node] = 1;
	}

	// Discard
	// . A node left out of the tree takes its anchors (and those of
	//   everything under it) with it.
	void Composer::Discard(const Node& node)
	{
		if(node.IsAlias())
			return;

		m_document.ClearAnchor(node);
		for(Node::node_seq::const_iterator it=node.Entries().begin();it!=node.Entries().end();++it)
			Discard(**it);
		for(Node::node_map::const_iterator it=node.Pairs().begin();it!=node.Pairs().end();++it) {
			Discard(*it->first);
			Discard(*it->second);
		}
	}

	bool Composer::IsAliasTarget(const Node& node) const
	{
		if(node.IsAlias())
			return false;
		if(m_aliasTargets.count(&node) > 0)
			return true;

		for(Node::node_seq::const_iterator it=node.Entries().begin();it!=node.Entries().end();++it) {
			if(IsAliasTarget(**it))
				return true;
		}
		for(Node::node_map::const_iterator it=node.Pairs().begin();it!=node.Pairs().end();++it) {
			if(IsAliasTarget(*it->first) || IsAliasTarget(*it->second))
				return true;
		}
		return false;
	}

	// Count
	// . Keeps the running totals under the configured ceilings.
	void Composer::Count(const Node& node, std::size_t expanded)
	{
		m_expandedTotal += expanded;

		if(m_document.NodeCount() > m_options.maxNodes)
			throw ComposeError(node.GetMark(), ComposeError::ExpansionLimitExceeded, ErrorMsg::TOO_MANY_NODES);
		if(m_expandedTotal > m_options.maxExpandedNodes)
			throw ComposeError(node.GetMark(), ComposeError::ExpansionLimitExceeded, ErrorMsg::EXPANSION_LIMIT);
	}
}
