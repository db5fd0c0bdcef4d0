#ifndef COMPOSER_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
#define COMPOSER_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17

#if defined(_MSC_VER) || (defined(__GNUC__) && (__GNUC__ == 3 && __GNUC_MINOR__ >= 4) || (__GNUC__ >= 4)) // GCC supports "pragma once" correctly since 3.4
#pragma once
#endif

#include "ytree/dll.h"
#include "ytree/eventhandler.h"
#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace YTree
{
	class Document;
	class Node;

	struct DuplicateKeyPolicy { enum value { Fail, FirstWins, LastWins }; };

	struct YTREE_API ComposerOptions {
		ComposerOptions(): duplicateKeys(DuplicateKeyPolicy::Fail), maxNodes(1000000), maxExpandedNodes(1000000) {}

		DuplicateKeyPolicy::value duplicateKeys;
		std::size_t maxNodes;           // nodes actually created
		std::size_t maxExpandedNodes;   // nodes there would be with every alias expanded
	};

	// Composer
	// . Builds one document out of the events it's fed.
	class YTREE_API Composer: public EventHandler
	{
	public:
		explicit Composer(Document& document, const ComposerOptions& options = ComposerOptions());
		virtual ~Composer();

		virtual void OnDocumentStart(const Mark& mark, const Directives& directives, bool isExplicit);
		virtual void OnDocumentEnd(const Mark& mark, bool isExplicit);

		virtual void OnAlias(const Mark& mark, const std::string& name);
		virtual void OnScalar(const Mark& mark, const std::string& tag, const std::string& anchor, const std::string& value, ScalarStyle::value style);

		virtual void OnSequenceStart(const Mark& mark, const std::string& tag, const std::string& anchor, CollectionStyle::value style);
		virtual void OnSequenceEnd(const Mark& mark);

		virtual void OnMapStart(const Mark& mark, const std::string& tag, const std::string& anchor, CollectionStyle::value style);
		virtual void OnMapEnd(const Mark& mark);

		bool IsFinished() const { return m_finished; }

	private:
		struct Frame {
			explicit Frame(Node *pNode_, std::size_t expandedStart_)
				: pNode(pNode_), expandedStart(expandedStart_), pPendingKey(0), dropPair(false) {}

			Node *pNode;
			std::size_t expandedStart;
			Node *pPendingKey;
			bool dropPair;
			std::map<std::pair<std::string, std::string>, Node *> scalarKeys;
			std::vector<Node *> otherKeys;
		};

		void Push(Node& node, const std::string& anchor);
		void Pop();
		void Insert(Node& node);
		void InsertKey(Frame& frame, Node& key);
		Node *FindDuplicate(Frame& frame, const Node& key) const;
		void RegisterAnchor(const std::string& anchor, Node& node);
		void Discard(const Node& node);
		bool IsAliasTarget(const Node& node) const;
		void Count(const Node& node, std::size_t expanded);

	private:
		Document& m_document;
		ComposerOptions m_options;
		bool m_finished;

		std::vector<Frame> m_stack;
		std::size_t m_expandedTotal;
		std::set<const Node *> m_aliasTargets;
		std::map<const Node *, std::size_t> m_expandedSizes;   // anchored nodes only
	};
}

#endif // COMPOSER_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
