// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "tandem/interaction/PointerSession.hpp"

#include <QtCore/QCoreApplication>
#include <QtCore/QDebug>
#include <QtGui/QMouseEvent>
#include <QtGui/QTouchEvent>
#include <QtWidgets/QWidget>

#include <utility>

namespace Tandem {

// ---------------------------------------------------------------------------
// ManualPointerSession
// ---------------------------------------------------------------------------

bool ManualPointerSession::capture(int pointerId)
{
	if (!m_captureAvailable)
		return false;
	m_captured = true;
	m_pointerId = pointerId;
	return true;
}

void ManualPointerSession::release()
{
	m_captured = false;
	m_pointerId = -1;
}

void ManualPointerSession::attach(MoveHandler onMove, EndHandler onEnd)
{
	m_onMove = std::move(onMove);
	m_onEnd = std::move(onEnd);
}

void ManualPointerSession::detach()
{
	m_onMove = {};
	m_onEnd = {};
}

void ManualPointerSession::dispatchMove(const PointerEvent& event)
{
	if (m_onMove) {
		const MoveHandler handler = m_onMove;
		handler(event);
	}
}

void ManualPointerSession::dispatchEnd(const PointerEvent& event)
{
	if (m_onEnd) {
		const EndHandler handler = m_onEnd;
		handler(event, false);
	}
}

void ManualPointerSession::dispatchCancel(const PointerEvent& event)
{
	if (m_onEnd) {
		const EndHandler handler = m_onEnd;
		handler(event, true);
	}
}

// ---------------------------------------------------------------------------
// EventFilterPointerSession
// ---------------------------------------------------------------------------

EventFilterPointerSession::EventFilterPointerSession(QWidget* captureTarget, QObject* parent)
	: QObject(parent)
	, m_captureTarget(captureTarget)
{}

EventFilterPointerSession::~EventFilterPointerSession()
{
	release();
	detach();
}

bool EventFilterPointerSession::capture(int pointerId)
{
	m_pointerId = pointerId;
	if (!m_captureTarget || !m_captureTarget->isVisible())
		return false;

	m_captureTarget->grabMouse();
	m_captured = true;
	return true;
}

void EventFilterPointerSession::release()
{
	if (m_captured && m_captureTarget)
		m_captureTarget->releaseMouse();
	m_captured = false;
	m_pointerId = -1;
}

void EventFilterPointerSession::attach(MoveHandler onMove, EndHandler onEnd)
{
	m_onMove = std::move(onMove);
	m_onEnd = std::move(onEnd);
	if (m_installed)
		return;

	auto* app = QCoreApplication::instance();
	if (!app) {
		qCWarning(tandemgesturelog) << "No application instance; pointer listeners not installed";
		return;
	}
	app->installEventFilter(this);
	m_installed = true;
}

void EventFilterPointerSession::detach()
{
	m_onMove = {};
	m_onEnd = {};
	if (!m_installed)
		return;
	if (auto* app = QCoreApplication::instance())
		app->removeEventFilter(this);
	m_installed = false;
}

void EventFilterPointerSession::finish(const PointerEvent& event, bool cancelled)
{
	if (m_onEnd) {
		const EndHandler handler = m_onEnd;
		handler(event, cancelled);
	}
}

bool EventFilterPointerSession::eventFilter(QObject* watched, QEvent* event)
{
	// Only window-level deliveries; widget-level copies of the same event are skipped.
	if (!watched->isWindowType())
		return QObject::eventFilter(watched, event);

	switch (event->type()) {
		case QEvent::MouseMove:
		case QEvent::MouseButtonRelease: {
			auto* me = static_cast<QMouseEvent*>(event);
			PointerEvent pe;
			pe.screenPos = me->globalPosition();
			pe.inputClass = InputClass::Mouse;
			pe.buttons = me->buttons();
			pe.modifiers = me->modifiers();
			if (event->type() == QEvent::MouseMove) {
				if (m_onMove) {
					const MoveHandler handler = m_onMove;
					handler(pe);
				}
			} else if (me->button() == Qt::LeftButton) {
				// Other buttons going up do not end a left-button gesture.
				finish(pe, false);
			}
			break;
		}
		case QEvent::TouchUpdate:
		case QEvent::TouchEnd:
		case QEvent::TouchCancel: {
			auto* te = static_cast<QTouchEvent*>(event);
			const QList<QEventPoint>& points = te->points();
			if (points.isEmpty())
				break;

			const QEventPoint* point = &points.front();
			for (const QEventPoint& p : points) {
				if (p.id() == m_pointerId) {
					point = &p;
					break;
				}
			}

			PointerEvent pe;
			pe.screenPos = point->globalPosition();
			pe.inputClass = InputClass::Touch;
			pe.pointerId = point->id();
			pe.modifiers = te->modifiers();

			if (event->type() == QEvent::TouchUpdate) {
				if (m_onMove) {
					const MoveHandler handler = m_onMove;
					handler(pe);
				}
			} else {
				finish(pe, event->type() == QEvent::TouchCancel);
			}
			break;
		}
		default:
			break;
	}

	return QObject::eventFilter(watched, event);
}

} // namespace Tandem
