#include "ytree/node.h"
#include "ytree/schema.h"
#include <cassert>
#include <map>

namespace YTree
{
	Node::Node(NodeType::value type, const Mark& mark, const std::string& tag)
		: m_type(type), m_mark(mark), m_tag(tag), m_scalarStyle(ScalarStyle::Any), m_collectionStyle(CollectionStyle::Any), m_pTarget(0)
	{
	}

	Node::~Node()
	{
	}

	// ResolvedTag
	// . "?" on a plain scalar goes through the core schema; "?" or "!"
	//   anywhere else gives the kind's default tag.
	const std::string Node::ResolvedTag() const
	{
		if(m_pTarget)
			return m_pTarget->ResolvedTag();

		if(m_tag != "?" && m_tag != "!")
			return m_tag;

		switch(m_type) {
			case NodeType::Sequence:
				return Tags::Seq;
			case NodeType::Map:
				return Tags::Map;
			default:
				break;
		}

		if(m_tag == "?" && (m_scalarStyle == ScalarStyle::Plain || m_scalarStyle == ScalarStyle::Any))
			return ResolvePlainScalar(m_scalarData);
		return Tags::Str;
	}

	std::size_t Node::size() const
	{
		switch(m_type) {
			case NodeType::Sequence:
				return m_seqData.size();
			case NodeType::Map:
				return m_mapData.size();
			default:
				return 0;
		}
	}

	const Node *Node::FindValue(const std::string& key) const
	{
		for(node_map::const_iterator it=m_mapData.begin();it!=m_mapData.end();++it) {
			const Node& k = it->first->Deref();
			if(k.Type() == NodeType::Scalar && k.Scalar() == key)
				return it->second;
		}
		return 0;
	}

	void Node::Append(Node& node)
	{
		assert(m_type == NodeType::Sequence);
		m_seqData.push_back(&node);
	}

	void Node::Insert(Node& key, Node& value)
	{
		assert(m_type == NodeType::Map);
		m_mapData.push_back(std::make_pair(&key, &value));
	}

	void Node::Remove(const Node& key)
	{
		for(node_map::iterator it=m_mapData.begin();it!=m_mapData.end();++it) {
			if(it->first == &key) {
				m_mapData.erase(it);
				return;
			}
		}
	}

	namespace
	{
		// NodeComparer
		// . Walks both trees in step. An alias matches when its target
		//   corresponds to the other alias' target.
		class NodeComparer
		{
		public:
			explicit NodeComparer(bool compareStyles): m_compareStyles(compareStyles) {}

			bool Equal(const Node& lhs, const Node& rhs)
			{
				if(lhs.Type() != rhs.Type())
					return false;

				if(lhs.IsAlias()) {
					const Node *pLhs = lhs.Target(), *pRhs = rhs.Target();
					std::map<const Node *, const Node *>::const_iterator it = m_pairs.find(pLhs);
					if(it != m_pairs.end())
						return it->second == pRhs;
					return pLhs == pRhs || Equal(*pLhs, *pRhs);
				}

				m_pairs[&lhs] = &rhs;
				if(lhs.ResolvedTag() != rhs.ResolvedTag())
					return false;

				switch(lhs.Type()) {
					case NodeType::Scalar:
						if(m_compareStyles && lhs.GetScalarStyle() != rhs.GetScalarStyle())
							return false;
						return lhs.Scalar() == rhs.Scalar();
					case NodeType::Sequence:
						if(m_compareStyles && lhs.GetCollectionStyle() != rhs.GetCollectionStyle())
							return false;
						if(lhs.size() != rhs.size())
							return false;
						for(std::size_t i=0;i<lhs.size();i++)
							if(!Equal(*lhs.Entries()[i], *rhs.Entries()[i]))
								return false;
						return true;
					case NodeType::Map:
						if(m_compareStyles && lhs.GetCollectionStyle() != rhs.GetCollectionStyle())
							return false;
						if(lhs.size() != rhs.size())
							return false;
						for(std::size_t i=0;i<lhs.size();i++) {
							if(!Equal(*lhs.Pairs()[i].first, *rhs.Pairs()[i].first))
								return false;
							if(!Equal(*lhs.Pairs()[i].second, *rhs.Pairs()[i].second))
								return false;
						}
						return true;
					case NodeType::Alias:
						break;
				}
				return false;
			}

		private:
			bool m_compareStyles;
			std::map<const Node *, const Node *> m_pairs;
		};
	}

	bool StructurallyEqual(const Node& lhs, const Node& rhs, bool compareStyles)
	{
		NodeComparer comparer(compareStyles);
		return comparer.Equal(lhs, rhs);
	}
}
