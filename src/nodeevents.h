#ifndef NODEEVENTS_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
#define NODEEVENTS_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17

#if defined(_MSC_VER) || (defined(__GNUC__) && (__GNUC__ == 3 && __GNUC_MINOR__ >= 4) || (__GNUC__ >= 4)) // GCC supports "pragma once" correctly since 3.4
#pragma once
#endif

#include "ytree/noncopyable.h"
#include <cstddef>
#include <map>
#include <set>
#include <string>

namespace YTree
{
	class AnchorTable;
	class Document;
	class EventHandler;
	class Node;

	// NodeEvents
	// . Walks a composed document and replays it as events. A node reached
	//   more than once is written once with an anchor, then as aliases.
	class NodeEvents: private noncopyable
	{
	public:
		explicit NodeEvents(const Document& document);

		void Emit(EventHandler& handler, bool forceExplicitStart = false);

	private:
		class AliasManager
		{
		public:
			explicit AliasManager(const AnchorTable& anchors): m_anchors(anchors), m_curAnchor(0) {}

			const std::string RegisterReference(const Node& node);
			void Close(const Node& node) { m_open.erase(&node); }

			const std::string LookupAnchor(const Node& node) const;
			bool IsOpen(const Node& node) const { return m_open.count(&node) > 0; }
			const Node *BoundNode(const std::string& name) const;

		private:
			const std::string _CreateNewAnchor();

		private:
			const AnchorTable& m_anchors;

			typedef std::map<const Node *, std::string> AnchorByIdentity;
			AnchorByIdentity m_anchorByIdentity;
			std::map<std::string, const Node *> m_nodeByAnchor;
			std::set<const Node *> m_open;

			std::size_t m_curAnchor;
		};

		void Setup(const Node& node);
		void Emit(const Node& node, EventHandler& handler, AliasManager& am) const;
		void EmitAlias(const Node& target, EventHandler& handler, const AliasManager& am) const;
		bool IsAliased(const Node& node) const;

	private:
		const Document& m_document;

		typedef std::map<const Node *, std::size_t> RefCount;
		RefCount m_refCount;
	};
}

#endif // NODEEVENTS_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
