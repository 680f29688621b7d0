// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <tandem/TandemSettings.hpp>
#include <tandem/TandemViewport.hpp>
#include <tandem/document/CommitReconciler.hpp>
#include <tandem/interaction/GestureArbiter.hpp>
#include <tandem/interaction/GestureController.hpp>
#include <tandem/interaction/InteractionState.hpp>
#include <tandem/layout/DisplayResolver.hpp>
#include <tandem/layout/LayoutCache.hpp>
#include <tandem/presence/PresenceSession.hpp>

#include <QtCore/QHash>
#include <QtCore/QPointer>
#include <QtWidgets/QWidget>

namespace Tandem {
class TandemDocument;
namespace Api { class IPresenceTransport; }
}

namespace TandemApp {

// One client's view of the shared document.
class CanvasWidget final : public QWidget
{
	Q_OBJECT

public:
	CanvasWidget(Tandem::TandemDocument& document,
				 Tandem::Api::IPresenceTransport& transport,
				 const Tandem::TandemSettings& settings,
				 QWidget* parent = nullptr);
	~CanvasWidget() override;

	Tandem::PresenceSession& session() { return m_session; }

protected:
	void paintEvent(QPaintEvent* e) override;
	void mousePressEvent(QMouseEvent* e) override;
	void wheelEvent(QWheelEvent* e) override;
	void keyPressEvent(QKeyEvent* e) override;

private:
	struct Hit final {
		const Tandem::TandemItem* item = nullptr;
		QRectF rect;
	};

	Tandem::GestureController* controllerFor(Tandem::ObjectId id);
	Hit hitItem(const QPointF& canvasPos) const;
	Tandem::PointerEvent toPointerEvent(const QMouseEvent* e) const;
	void syncOriginBounds();

	void drawItem(QPainter& p, const Tandem::TandemItem& item, const Tandem::DisplayTransform& t);
	void drawGroup(QPainter& p, const Tandem::TandemItem& group);

	Tandem::TandemDocument& m_document;
	Tandem::TandemSettings m_settings;
	Tandem::PresenceSession m_session;
	Tandem::CommitReconciler m_reconciler;
	Tandem::GestureArbiter m_arbiter;
	Tandem::InteractionState m_interaction;
	Tandem::TandemViewport m_viewport;
	Tandem::DisplayResolver m_resolver;
	Tandem::LayoutCache m_layout;

	QHash<Tandem::ObjectId, QPointer<Tandem::GestureController>> m_controllers;
};

} // namespace TandemApp
