#ifndef EMITTERSTATE_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
#define EMITTERSTATE_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17

#if defined(_MSC_VER) || (defined(__GNUC__) && (__GNUC__ == 3 && __GNUC_MINOR__ >= 4) || (__GNUC__ >= 4)) // GCC supports "pragma once" correctly since 3.4
#pragma once
#endif

#include "ptr_stack.h"
#include "setting.h"
#include "ytree/emitterdef.h"
#include "ytree/emittermanip.h"
#include "ytree/exceptions.h"
#include <cassert>
#include <cstddef>
#include <map>
#include <memory>
#include <string>

namespace YTree
{
	struct FmtScope { enum value { Local, Global }; };
	struct GroupType { enum value { None, Seq, Map }; };
	struct FlowType { enum value { None, Flow, Block }; };

	class EmitterState
	{
	public:
		EmitterState();
		~EmitterState();

		// basic state checking
		bool good() const { return m_isGood; }
		const std::string GetLastError() const { return m_lastError; }
		EmitError::Kind GetLastErrorKind() const { return m_lastErrorKind; }
		void SetError(EmitError::Kind kind, const std::string& error);

		// node handling
		void SetAnchor(const std::string& name);
		void SetTag();
		void SetNonContent();
		void SetLongKey();
		void ForceFlow();
		void StartedDoc();
		void EndedDoc();
		void StartedScalar();
		void StartedGroup(GroupType::value type);
		void EndedGroup(GroupType::value type);

		EmitterNodeType::value NextGroupType(GroupType::value type) const;
		EmitterNodeType::value CurGroupNodeType() const;

		GroupType::value CurGroupType() const;
		FlowType::value CurGroupFlowType() const;
		int CurGroupIndent() const;
		std::size_t CurGroupChildCount() const;
		bool CurGroupLongKey() const;
		bool CurGroupExpectsKey() const;

		int LastIndent() const;
		int CurIndent() const { return m_curIndent; }
		bool HasAnchor() const { return m_hasAnchor; }
		bool HasTag() const { return m_hasTag; }
		bool HasBegunNode() const { return m_hasAnchor || m_hasTag || m_hasNonContent; }
		bool HasBegunContent() const { return m_hasAnchor || m_hasTag; }
		bool DocEnded() const { return m_docEnded; }

		// anchors written in the current document
		bool IsAnchorWritten(const std::string& name) const;
		bool IsAnchorOpen(const std::string& name) const;
		void ClearAnchors() { m_anchors.clear(); }

		void ClearModifiedSettings();

		// formatters
		void SetLocalValue(EMITTER_MANIP value);

		bool SetOutputCharset(EMITTER_MANIP value, FmtScope::value scope);
		EMITTER_MANIP GetOutputCharset() const { return m_charset.get(); }

		bool SetStringFormat(EMITTER_MANIP value, FmtScope::value scope);
		EMITTER_MANIP GetStringFormat() const { return m_strFmt.get(); }

		bool SetIndent(unsigned value, FmtScope::value scope);
		int GetIndent() const { return m_indent.get(); }

		bool SetPreCommentIndent(unsigned value, FmtScope::value scope);
		int GetPreCommentIndent() const { return m_preCommentIndent.get(); }
		bool SetPostCommentIndent(unsigned value, FmtScope::value scope);
		int GetPostCommentIndent() const { return m_postCommentIndent.get(); }

		bool SetFlowType(GroupType::value groupType, EMITTER_MANIP value, FmtScope::value scope);
		EMITTER_MANIP GetFlowType(GroupType::value groupType) const;

		bool SetMapKeyFormat(EMITTER_MANIP value, FmtScope::value scope);
		EMITTER_MANIP GetMapKeyFormat() const { return m_mapKeyFmt.get(); }

		bool SetLineWidth(unsigned value, FmtScope::value scope);
		unsigned GetLineWidth() const { return m_lineWidth.get(); }

	private:
		template <typename T>
		void _Set(Setting<T>& fmt, T value, FmtScope::value scope);

		void StartedNode();

	private:
		// basic state ok?
		bool m_isGood;
		std::string m_lastError;
		EmitError::Kind m_lastErrorKind;

		// other state
		Setting<EMITTER_MANIP> m_charset;
		Setting<EMITTER_MANIP> m_strFmt;
		Setting<unsigned> m_indent;
		Setting<unsigned> m_preCommentIndent, m_postCommentIndent;
		Setting<EMITTER_MANIP> m_seqFmt;
		Setting<EMITTER_MANIP> m_mapFmt;
		Setting<EMITTER_MANIP> m_mapKeyFmt;
		Setting<unsigned> m_lineWidth;

		SettingChanges m_modifiedSettings;
		SettingChanges m_globalModifiedSettings;

		struct Group {
			explicit Group(GroupType::value type_): type(type_), flowType(FlowType::None), indent(0), childCount(0), longKey(false) {}

			GroupType::value type;
			FlowType::value flowType;
			int indent;
			std::size_t childCount;
			bool longKey;
			std::string anchor;

			SettingChanges modifiedSettings;

			EmitterNodeType::value NodeType() const {
				if(type == GroupType::Seq)
					return flowType == FlowType::Flow ? EmitterNodeType::FlowSeq : EmitterNodeType::BlockSeq;
				return flowType == FlowType::Flow ? EmitterNodeType::FlowMap : EmitterNodeType::BlockMap;
			}
		};

		ptr_stack<Group> m_groups;
		unsigned m_curIndent;
		bool m_hasAnchor;
		bool m_hasTag;
		bool m_hasNonContent;
		bool m_docEnded;
		std::size_t m_docCount;

		std::string m_pendingAnchor;
		std::map<std::string, bool> m_anchors; // name -> closed
	};

	template <typename T>
	void EmitterState::_Set(Setting<T>& fmt, T value, FmtScope::value scope) {
		switch(scope) {
			case FmtScope::Local:
				m_modifiedSettings.push(fmt.set(value));
				break;
			case FmtScope::Global:
				fmt.set(value);
				m_globalModifiedSettings.push(fmt.set(value));  // this pushes an identity set, so when we restore,
				                                                // it restores to the value here, and not the previous one
				break;
			default:
				assert(false);
		}
	}
}

#endif // EMITTERSTATE_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
