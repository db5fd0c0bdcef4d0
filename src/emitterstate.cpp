#include "emitterstate.h"

namespace YTree
{
	EmitterState::EmitterState()
		: m_isGood(true)
		, m_lastErrorKind(EmitError::InvalidState)
		, m_curIndent(0)
		, m_hasAnchor(false)
		, m_hasTag(false)
		, m_hasNonContent(false)
		, m_docEnded(false)
		, m_docCount(0)
	{
		// set default global manipulators
		m_charset.set(EmitNonAscii);
		m_strFmt.set(Auto);
		m_indent.set(2);
		m_preCommentIndent.set(2);
		m_postCommentIndent.set(1);
		m_seqFmt.set(Block);
		m_mapFmt.set(Block);
		m_mapKeyFmt.set(Auto);
		m_lineWidth.set(0);
	}

	EmitterState::~EmitterState()
	{
	}

	// SetError
	// . Only the first error sticks.
	void EmitterState::SetError(EmitError::Kind kind, const std::string& error)
	{
		if(!m_isGood)
			return;

		m_isGood = false;
		m_lastErrorKind = kind;
		m_lastError = error;
	}

	// SetLocalValue
	// . We blindly tries to set all possible formatters to this value
	// . Only the ones that make sense will be accepted
	void EmitterState::SetLocalValue(EMITTER_MANIP value)
	{
		SetOutputCharset(value, FmtScope::Local);
		SetStringFormat(value, FmtScope::Local);
		SetFlowType(GroupType::Seq, value, FmtScope::Local);
		SetFlowType(GroupType::Map, value, FmtScope::Local);
		SetMapKeyFormat(value, FmtScope::Local);
	}

	void EmitterState::SetAnchor(const std::string& name)
	{
		m_hasAnchor = true;
		m_pendingAnchor = name;
	}

	void EmitterState::SetTag()
	{
		m_hasTag = true;
	}

	void EmitterState::SetNonContent()
	{
		m_hasNonContent = true;
	}

	void EmitterState::SetLongKey()
	{
		assert(!m_groups.empty());
		if(m_groups.empty())
			return;

		assert(m_groups.top().type == GroupType::Map);
		m_groups.top().longKey = true;
	}

	void EmitterState::ForceFlow()
	{
		assert(!m_groups.empty());
		if(m_groups.empty())
			return;

		m_groups.top().flowType = FlowType::Flow;
	}

	void EmitterState::StartedNode()
	{
		if(m_groups.empty()) {
			m_docCount++;
		} else {
			m_groups.top().childCount++;
			if(m_groups.top().childCount % 2 == 0)
				m_groups.top().longKey = false;
		}

		m_hasAnchor = false;
		m_hasTag = false;
		m_hasNonContent = false;
		m_docEnded = false;
	}

	EmitterNodeType::value EmitterState::NextGroupType(GroupType::value type) const
	{
		if(type == GroupType::Seq)
			return GetFlowType(type) == Block ? EmitterNodeType::BlockSeq : EmitterNodeType::FlowSeq;
		return GetFlowType(type) == Block ? EmitterNodeType::BlockMap : EmitterNodeType::FlowMap;
	}

	void EmitterState::StartedDoc()
	{
		m_hasAnchor = false;
		m_hasTag = false;
		m_hasNonContent = false;
		m_docEnded = false;
		m_pendingAnchor.clear();
		m_anchors.clear();
	}

	void EmitterState::EndedDoc()
	{
		m_hasAnchor = false;
		m_hasTag = false;
		m_hasNonContent = false;
		m_docEnded = true;
		m_pendingAnchor.clear();
		m_anchors.clear();
	}

	void EmitterState::StartedScalar()
	{
		const std::string anchor = m_pendingAnchor;
		m_pendingAnchor.clear();

		StartedNode();
		ClearModifiedSettings();

		if(!anchor.empty())
			m_anchors[anchor] = true;
	}

	void EmitterState::StartedGroup(GroupType::value type)
	{
		const std::string anchor = m_pendingAnchor;
		m_pendingAnchor.clear();

		StartedNode();

		const int lastGroupIndent = (m_groups.empty() ? 0 : m_groups.top().indent);
		m_curIndent += lastGroupIndent;

		std::unique_ptr<Group> pGroup(new Group(type));

		// transfer settings (which last until this group is done)
		pGroup->modifiedSettings = std::move(m_modifiedSettings);

		// set up group
		pGroup->flowType = (GetFlowType(type) == Block ? FlowType::Block : FlowType::Flow);
		pGroup->indent = GetIndent();
		pGroup->anchor = anchor;
		if(!anchor.empty())
			m_anchors[anchor] = false;

		m_groups.push(std::move(pGroup));
	}

	void EmitterState::EndedGroup(GroupType::value type)
	{
		if(m_groups.empty()) {
			if(type == GroupType::Seq)
				return SetError(EmitError::InvalidState, ErrorMsg::UNEXPECTED_END_SEQ);
			return SetError(EmitError::InvalidState, ErrorMsg::UNEXPECTED_END_MAP);
		}

		// get rid of the current group
		{
			std::unique_ptr<Group> pFinishedGroup = m_groups.pop();
			if(pFinishedGroup->type != type)
				return SetError(EmitError::InvalidState, ErrorMsg::UNMATCHED_GROUP_TAG);
			if(!pFinishedGroup->anchor.empty())
				m_anchors[pFinishedGroup->anchor] = true;
		}

		// reset old settings
		const unsigned lastIndent = (m_groups.empty() ? 0 : m_groups.top().indent);
		assert(m_curIndent >= lastIndent);
		m_curIndent -= lastIndent;

		// some global settings that we changed may have been overridden
		// by a local setting we just popped, so we need to restore them
		m_globalModifiedSettings.replay();

		ClearModifiedSettings();
	}

	EmitterNodeType::value EmitterState::CurGroupNodeType() const
	{
		if(m_groups.empty())
			return EmitterNodeType::NoType;

		return m_groups.top().NodeType();
	}

	GroupType::value EmitterState::CurGroupType() const
	{
		return m_groups.empty() ? GroupType::None : m_groups.top().type;
	}

	FlowType::value EmitterState::CurGroupFlowType() const
	{
		return m_groups.empty() ? FlowType::None : m_groups.top().flowType;
	}

	int EmitterState::CurGroupIndent() const
	{
		return m_groups.empty() ? 0 : m_groups.top().indent;
	}

	std::size_t EmitterState::CurGroupChildCount() const
	{
		return m_groups.empty() ? m_docCount : m_groups.top().childCount;
	}

	bool EmitterState::CurGroupLongKey() const
	{
		return m_groups.empty() ? false : m_groups.top().longKey;
	}

	bool EmitterState::CurGroupExpectsKey() const
	{
		return CurGroupType() == GroupType::Map && m_groups.top().childCount % 2 == 0;
	}

	int EmitterState::LastIndent() const
	{
		if(m_groups.size() <= 1)
			return 0;

		return m_curIndent - m_groups.top(-1).indent;
	}

	bool EmitterState::IsAnchorWritten(const std::string& name) const
	{
		std::map<std::string, bool>::const_iterator it = m_anchors.find(name);
		return it != m_anchors.end() && it->second;
	}

	bool EmitterState::IsAnchorOpen(const std::string& name) const
	{
		std::map<std::string, bool>::const_iterator it = m_anchors.find(name);
		return it != m_anchors.end() && !it->second;
	}

	void EmitterState::ClearModifiedSettings()
	{
		m_modifiedSettings.clear();
	}

	bool EmitterState::SetOutputCharset(EMITTER_MANIP value, FmtScope::value scope)
	{
		switch(value) {
			case EmitNonAscii:
			case EscapeNonAscii:
				_Set(m_charset, value, scope);
				return true;
			default:
				return false;
		}
	}

	bool EmitterState::SetStringFormat(EMITTER_MANIP value, FmtScope::value scope)
	{
		switch(value) {
			case Auto:
			case Plain:
			case SingleQuoted:
			case DoubleQuoted:
			case Literal:
			case Folded:
				_Set(m_strFmt, value, scope);
				return true;
			default:
				return false;
		}
	}

	bool EmitterState::SetIndent(unsigned value, FmtScope::value scope)
	{
		if(value == 0)
			return false;

		_Set(m_indent, value, scope);
		return true;
	}

	bool EmitterState::SetPreCommentIndent(unsigned value, FmtScope::value scope)
	{
		if(value == 0)
			return false;

		_Set(m_preCommentIndent, value, scope);
		return true;
	}

	bool EmitterState::SetPostCommentIndent(unsigned value, FmtScope::value scope)
	{
		if(value == 0)
			return false;

		_Set(m_postCommentIndent, value, scope);
		return true;
	}

	bool EmitterState::SetFlowType(GroupType::value groupType, EMITTER_MANIP value, FmtScope::value scope)
	{
		switch(value) {
			case Block:
			case Flow:
				_Set(groupType == GroupType::Seq ? m_seqFmt : m_mapFmt, value, scope);
				return true;
			default:
				return false;
		}
	}

	EMITTER_MANIP EmitterState::GetFlowType(GroupType::value groupType) const
	{
		// force flow style if we're currently in a flow
		if(CurGroupFlowType() == FlowType::Flow)
			return Flow;

		// otherwise, go with what's asked of us
		return (groupType == GroupType::Seq ? m_seqFmt.get() : m_mapFmt.get());
	}

	bool EmitterState::SetMapKeyFormat(EMITTER_MANIP value, FmtScope::value scope)
	{
		switch(value) {
			case Auto:
			case LongKey:
				_Set(m_mapKeyFmt, value, scope);
				return true;
			default:
				return false;
		}
	}

	bool EmitterState::SetLineWidth(unsigned value, FmtScope::value scope)
	{
		_Set(m_lineWidth, value, scope);
		return true;
	}
}
