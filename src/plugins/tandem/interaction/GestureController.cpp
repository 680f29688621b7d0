// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "tandem/interaction/GestureController.hpp"

#include "tandem/TandemViewport.hpp"
#include "tandem/Tools.hpp"
#include "tandem/api/ITandemDocument.hpp"
#include "tandem/document/CommitReconciler.hpp"
#include "tandem/document/TandemItem.hpp"
#include "tandem/interaction/InteractionState.hpp"
#include "tandem/layout/DisplayResolver.hpp"
#include "tandem/presence/PresenceSession.hpp"

#include <QtCore/QDebug>

#include <utility>

namespace Tandem {

bool GestureServices::isComplete() const
{
	return document && reconciler && presence && arbiter && interaction && viewport && resolver;
}

GestureController::GestureController(ObjectId itemId,
									 GestureServices services,
									 std::unique_ptr<IPointerSession> pointer,
									 QObject* parent)
	: QObject(parent)
	, m_itemId(itemId)
	, m_services(std::move(services))
	, m_pointer(std::move(pointer))
{
	if (!m_pointer)
		m_pointer = std::make_unique<ManualPointerSession>();
	if (!m_services.isComplete())
		qCWarning(tandemgesturelog) << "Gesture controller for item" << m_itemId.value() << "is missing services";
}

GestureController::~GestureController()
{
	abort(false);
}

bool GestureController::pointerDown(const PointerEvent& event, bool onInteractiveControl)
{
	if (!m_services.isComplete())
		return false;
	if (event.inputClass == InputClass::Mouse && !event.buttons.testFlag(Qt::LeftButton))
		return false;
	if (!m_services.document->findItem(m_itemId))
		return false;

	if (!claim(event, GestureKind::Drag))
		return false;

	// A value this item left behind must not leak into the new gesture. Values of
	// other items belong to gestures still running on the other input class.
	const auto& stale = m_services.presence->drag().currentLocalValue();
	if (stale && stale->itemId == m_itemId)
		m_services.presence->drag().clear();

	const TandemItem* item = m_services.document->findItem(m_itemId);
	const DisplayTransform display = m_services.resolver->resolve(*item);

	m_start = Start{};
	m_start.screen = event.screenPos;
	m_start.canvas = m_services.viewport->toCanvas(event.screenPos);
	m_start.position = display.position;
	m_start.rotation = display.rotation;
	m_start.threshold = m_services.settings.dragThreshold(onInteractiveControl);
	m_start.blocked = !m_services.resolver->canDrag(*item);

	setState(GestureState::Armed);
	qCDebug(tandemgesturelog) << "Drag armed" << m_itemId.value() << "threshold" << m_start.threshold;
	return true;
}

bool GestureController::beginRotate(const PointerEvent& event)
{
	if (!m_services.isComplete())
		return false;
	const TandemItem* item = m_services.document->findItem(m_itemId);
	if (!item || !m_services.resolver->canRotate(*item))
		return false;

	if (!claim(event, GestureKind::Rotate))
		return false;

	const DisplayTransform display = m_services.resolver->resolve(*item);
	m_start = Start{};
	m_start.screen = event.screenPos;
	m_start.canvas = m_services.viewport->toCanvas(event.screenPos);
	m_start.position = display.position;
	m_start.rotation = display.rotation;
	m_start.screenCenter = m_services.viewport->fromCanvas(
		display.position + QPointF(display.size.width() / 2.0, display.size.height() / 2.0));

	activate();
	publishDrag(DragState{m_itemId,
						  m_start.position.x(),
						  m_start.position.y(),
						  m_start.rotation,
						  m_services.presence->branch()});
	return true;
}

bool GestureController::beginResize(const PointerEvent& event, ResizeHandle handle)
{
	if (!m_services.isComplete())
		return false;
	const TandemItem* item = m_services.document->findItem(m_itemId);
	if (!item || !m_services.resolver->canResize(*item))
		return false;

	const DisplayTransform display = m_services.resolver->resolve(*item);
	const double dimension = item->content().resizableDimension();

	ResizeRequest probe;
	probe.handle = handle;
	probe.startTopLeft = display.position;
	probe.startDimension = dimension;
	if (!item->content().resize(probe, m_services.settings))
		return false;

	if (!claim(event, GestureKind::Resize))
		return false;

	m_start = Start{};
	m_start.screen = event.screenPos;
	m_start.canvas = m_services.viewport->toCanvas(event.screenPos);
	m_start.position = display.position;
	m_start.rotation = display.rotation;
	m_start.dimension = dimension;
	m_start.handle = handle;
	m_start.screenCenter = m_services.viewport->fromCanvas(
		display.position + QPointF(display.size.width() / 2.0, display.size.height() / 2.0));

	activate();
	publishResize(ResizeState{m_itemId, m_start.position.x(), m_start.position.y(), m_start.dimension});
	return true;
}

void GestureController::cancel()
{
	abort(true);
}

bool GestureController::claim(const PointerEvent& event, GestureKind kind)
{
	if (m_state != GestureState::Idle)
		abort(true);

	m_inputClass = event.inputClass;
	m_kind = kind;
	m_token = m_services.arbiter->begin(event.inputClass, [this]() { abort(true); });

	if (!m_pointer->capture(event.pointerId))
		qCDebug(tandemgesturelog) << "Pointer capture unavailable for item" << m_itemId.value();

	m_pointer->attach([this](const PointerEvent& e) { handleMove(e); },
					  [this](const PointerEvent& e, bool cancelled) { handleEnd(e, cancelled); });
	return true;
}

void GestureController::activate()
{
	setState(GestureState::Active);
	if (!m_holdsManipulation) {
		m_services.interaction->beginManipulation();
		m_holdsManipulation = true;
	}
}

void GestureController::setState(GestureState state)
{
	if (m_state == state)
		return;
	m_state = state;
	emit stateChanged(m_state);
}

void GestureController::handleMove(const PointerEvent& event)
{
	if (m_state != GestureState::Armed && m_state != GestureState::Active)
		return;

	switch (m_kind) {
		case GestureKind::Drag:
			updateDrag(event);
			break;
		case GestureKind::Rotate:
			updateRotate(event);
			break;
		case GestureKind::Resize:
			updateResize(event);
			break;
		case GestureKind::None:
			break;
	}
}

void GestureController::handleEnd(const PointerEvent& event, bool cancelled)
{
	Q_UNUSED(event);

	if (m_state == GestureState::Armed) {
		teardown();
		emit clicked(m_itemId);
		return;
	}
	if (m_state != GestureState::Active)
		return;

	if (cancelled)
		qCDebug(tandemgesturelog) << "Pointer cancelled; committing last value of" << m_itemId.value();
	commit();
}

void GestureController::updateDrag(const PointerEvent& event)
{
	if (m_state == GestureState::Armed) {
		if (m_start.blocked)
			return;
		const double distance = Tools::Math::vectorLength(event.screenPos - m_start.screen);
		if (distance < m_start.threshold)
			return;
		activate();
		qCDebug(tandemgesturelog) << "Drag active" << m_itemId.value();
	}

	const QPointF canvasNow = m_services.viewport->toCanvas(event.screenPos);
	const QPointF position = m_start.position + (canvasNow - m_start.canvas);
	publishDrag(DragState{m_itemId, position.x(), position.y(), m_start.rotation, m_services.presence->branch()});
}

void GestureController::updateRotate(const PointerEvent& event)
{
	const double rotation = Tools::Math::rotationFromCenter(m_start.screenCenter, event.screenPos);
	publishDrag(DragState{m_itemId,
						  m_start.position.x(),
						  m_start.position.y(),
						  rotation,
						  m_services.presence->branch()});
}

void GestureController::updateResize(const PointerEvent& event)
{
	const TandemItem* item = m_services.document->findItem(m_itemId);
	if (!item) {
		qCDebug(tandemgesturelog) << "Item" << m_itemId.value() << "vanished during resize";
		abort(true);
		return;
	}

	ResizeRequest request;
	request.handle = m_start.handle;
	request.startTopLeft = m_start.position;
	request.startDimension = m_start.dimension;
	request.initialVector = m_start.screen - m_start.screenCenter;
	request.currentVector = event.screenPos - m_start.screenCenter;
	request.canvasDeltaX = m_services.viewport->toCanvas(event.screenPos).x() - m_start.canvas.x();

	const auto geometry = item->content().resize(request, m_services.settings);
	if (!geometry)
		return;

	publishResize(ResizeState{m_itemId, geometry->topLeft.x(), geometry->topLeft.y(), geometry->dimension});
}

void GestureController::publishDrag(const DragState& state)
{
	m_lastDrag = state;
	m_services.presence->drag().publish(state);
}

void GestureController::publishResize(const ResizeState& state)
{
	m_lastResize = state;
	m_services.presence->resize().publish(state);
}

QPointF GestureController::toItemFrame(const QPointF& absolute) const
{
	if (const TandemItem* parent = m_services.document->parentOf(m_itemId))
		return absolute - parent->position();
	return absolute;
}

void GestureController::commit()
{
	setState(GestureState::Committing);

	const GestureKind kind = m_kind;
	std::optional<Utils::Result> result;

	switch (kind) {
		case GestureKind::Drag:
			if (m_lastDrag)
				result = m_services.reconciler->commitMove(m_itemId, toItemFrame(m_lastDrag->position()));
			break;
		case GestureKind::Rotate:
			if (m_lastDrag)
				result = m_services.reconciler->commitRotation(m_itemId, m_lastDrag->rotation);
			break;
		case GestureKind::Resize:
			if (m_lastResize)
				result = m_services.reconciler->commitResize(m_itemId,
															 toItemFrame(m_lastResize->position()),
															 m_lastResize->size);
			break;
		case GestureKind::None:
			break;
	}

	clearPublished();
	if (m_holdsManipulation) {
		m_services.interaction->endManipulation();
		m_holdsManipulation = false;
	}
	m_services.interaction->suppressBackgroundClear(m_services.settings.suppressBackgroundClearMs);
	teardown();

	if (!result) {
		qCDebug(tandemgesturelog) << "Nothing to commit for item" << m_itemId.value();
		emit cancelled(m_itemId);
		return;
	}
	if (result->ok)
		emit committed(m_itemId, kind);
	else
		emit commitFailed(m_itemId, kind, result->message());
}

void GestureController::clearPublished()
{
	switch (m_kind) {
		case GestureKind::Drag:
		case GestureKind::Rotate: {
			const auto& value = m_services.presence->drag().currentLocalValue();
			if (value && value->itemId == m_itemId)
				m_services.presence->drag().clear();
			break;
		}
		case GestureKind::Resize: {
			const auto& value = m_services.presence->resize().currentLocalValue();
			if (value && value->itemId == m_itemId)
				m_services.presence->resize().clear();
			break;
		}
		case GestureKind::None:
			break;
	}
}

void GestureController::teardown()
{
	if (m_holdsManipulation) {
		m_services.interaction->endManipulation();
		m_holdsManipulation = false;
	}

	m_pointer->release();
	m_pointer->detach();

	if (m_token) {
		m_services.arbiter->end(m_inputClass, m_token);
		m_token = GestureToken{};
	}

	m_lastDrag.reset();
	m_lastResize.reset();
	m_kind = GestureKind::None;
	setState(GestureState::Idle);
}

void GestureController::abort(bool notify)
{
	if (m_state == GestureState::Idle)
		return;

	qCDebug(tandemgesturelog) << "Gesture on item" << m_itemId.value() << "cancelled";
	clearPublished();
	teardown();
	if (notify)
		emit cancelled(m_itemId);
}

} // namespace Tandem
