// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "tandem/TandemGlobal.hpp"
#include "tandem/TandemSettings.hpp"
#include "tandem/TandemTypes.hpp"
#include "tandem/document/TandemContent.hpp"
#include "tandem/interaction/GestureArbiter.hpp"
#include "tandem/interaction/PointerSession.hpp"
#include "tandem/presence/EphemeralStates.hpp"

#include <QtCore/QObject>
#include <QtCore/QPointF>

#include <memory>
#include <optional>

namespace Tandem {

class CommitReconciler;
class DisplayResolver;
class InteractionState;
class PresenceSession;
class TandemViewport;

namespace Api {
class ITandemDocument;
}

enum class GestureState : quint8 {
	Idle,
	Armed,
	Active,
	Committing
};

enum class GestureKind : quint8 {
	None,
	Drag,
	Rotate,
	Resize
};

// Session-owned collaborators shared by every controller of one view.
struct TANDEM_EXPORT GestureServices final {
	Api::ITandemDocument* document = nullptr;
	CommitReconciler* reconciler = nullptr;
	PresenceSession* presence = nullptr;
	GestureArbiter* arbiter = nullptr;
	InteractionState* interaction = nullptr;
	const TandemViewport* viewport = nullptr;
	const DisplayResolver* resolver = nullptr;
	TandemSettings settings;

	bool isComplete() const;
};

// Pointer state machine of one interactive item. Drag arms on press and
// activates past the threshold; rotate and resize are active from the
// handle press. Only the last published value is committed.
class TANDEM_EXPORT GestureController final : public QObject
{
	Q_OBJECT

public:
	GestureController(ObjectId itemId,
					  GestureServices services,
					  std::unique_ptr<IPointerSession> pointer,
					  QObject* parent = nullptr);
	~GestureController() override;

	ObjectId itemId() const noexcept { return m_itemId; }
	GestureState state() const noexcept { return m_state; }
	GestureKind kind() const noexcept { return m_kind; }
	bool isIdle() const noexcept { return m_state == GestureState::Idle; }

	IPointerSession& pointerSession() { return *m_pointer; }

	bool pointerDown(const PointerEvent& event, bool onInteractiveControl = false);
	bool beginRotate(const PointerEvent& event);
	bool beginResize(const PointerEvent& event, ResizeHandle handle);

	void cancel();

signals:
	void stateChanged(Tandem::GestureState state);
	void clicked(Tandem::ObjectId itemId);
	void committed(Tandem::ObjectId itemId, Tandem::GestureKind kind);
	void commitFailed(Tandem::ObjectId itemId, Tandem::GestureKind kind, const QString& message);
	void cancelled(Tandem::ObjectId itemId);

private:
	struct Start final {
		QPointF screen;
		QPointF canvas;
		QPointF position;
		double rotation = 0.0;
		QPointF screenCenter;
		double dimension = 0.0;
		ResizeHandle handle = ResizeHandle::Corner;
		double threshold = 0.0;
		bool blocked = false;
	};

	bool claim(const PointerEvent& event, GestureKind kind);
	void activate();
	void setState(GestureState state);

	void handleMove(const PointerEvent& event);
	void handleEnd(const PointerEvent& event, bool cancelled);

	void updateDrag(const PointerEvent& event);
	void updateRotate(const PointerEvent& event);
	void updateResize(const PointerEvent& event);

	void publishDrag(const DragState& state);
	void publishResize(const ResizeState& state);

	void commit();
	QPointF toItemFrame(const QPointF& absolute) const;

	void clearPublished();
	void teardown();
	void abort(bool notify);

	ObjectId m_itemId{};
	GestureServices m_services;
	std::unique_ptr<IPointerSession> m_pointer;

	GestureState m_state = GestureState::Idle;
	GestureKind m_kind = GestureKind::None;
	InputClass m_inputClass = InputClass::Mouse;
	GestureToken m_token{};
	bool m_holdsManipulation = false;
	Start m_start;

	// What this controller last published. The client's channel holds one value,
	// which a concurrent gesture of the other input class may overwrite.
	std::optional<DragState> m_lastDrag;
	std::optional<ResizeState> m_lastResize;
};

} // namespace Tandem

Q_DECLARE_METATYPE(Tandem::GestureState)
Q_DECLARE_METATYPE(Tandem::GestureKind)
