// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "CanvasWidget.hpp"

#include <tandem/document/TandemDocument.hpp>
#include <tandem/layout/GroupGeometry.hpp>

#include <QtCore/QLineF>
#include <QtGui/QKeyEvent>
#include <QtGui/QMouseEvent>
#include <QtGui/QPainter>
#include <QtGui/QPainterPath>
#include <QtGui/QWheelEvent>

#include <cmath>
#include <numbers>

namespace TandemApp {

using namespace Tandem;
using namespace Qt::StringLiterals;

namespace {

constexpr double kHandleRadiusPx = 6.0;
constexpr double kRotateHandleOffsetPx = 28.0;
constexpr double kEdgeGrabPx = 8.0;

const QColor kBackground(0xF5, 0xF6, 0xF8);
const QColor kLocalSelection(0x2F, 0x6F, 0xEB);
const QColor kRemoteSelection(0xE8, 0x8A, 0x1A);
const QColor kGroupOutline(0x8A, 0x93, 0xA0);

QTransform itemTransform(const DisplayTransform& t)
{
	const QPointF center = t.position + QPointF(t.size.width() / 2.0, t.size.height() / 2.0);
	QTransform tr;
	tr.translate(center.x(), center.y());
	tr.rotate(t.rotation);
	tr.translate(-t.size.width() / 2.0, -t.size.height() / 2.0);
	return tr;
}

QPolygonF starPolygon(const QRectF& r)
{
	QPolygonF poly;
	const QPointF c = r.center();
	const double outer = std::min(r.width(), r.height()) / 2.0;
	const double inner = outer * 0.45;
	for (int i = 0; i < 10; ++i) {
		const double radius = (i % 2 == 0) ? outer : inner;
		const double angle = std::numbers::pi / 5.0 * i - std::numbers::pi / 2.0;
		poly << QPointF(c.x() + radius * std::cos(angle), c.y() + radius * std::sin(angle));
	}
	return poly;
}

} // namespace

CanvasWidget::CanvasWidget(TandemDocument& document,
						   Api::IPresenceTransport& transport,
						   const TandemSettings& settings,
						   QWidget* parent)
	: QWidget(parent)
	, m_document(document)
	, m_settings(settings)
	, m_session(transport, u"main"_s)
	, m_reconciler(document)
	, m_resolver(document, m_session, settings)
{
	setObjectName("CanvasWidget");
	setFocusPolicy(Qt::StrongFocus);
	setAttribute(Qt::WA_OpaquePaintEvent, true);
	setMinimumSize(480, 360);

	connect(&m_document, &Api::ITandemDocument::changed, this, QOverload<>::of(&CanvasWidget::update));
	connect(&m_session, &PresenceSession::presenceChanged, this, QOverload<>::of(&CanvasWidget::update));
	connect(&m_viewport, &TandemViewport::zoomChanged, this, QOverload<>::of(&CanvasWidget::update));
	connect(&m_viewport, &TandemViewport::panChanged, this, QOverload<>::of(&CanvasWidget::update));
	connect(&m_reconciler, &CommitReconciler::commitFailed, this,
			[this](ObjectId id, const QString& label, const QString& message) {
				qCWarning(tandemdocumentlog).noquote()
					<< objectName() << label << "of" << id.value() << "failed:" << message;
			});
}

CanvasWidget::~CanvasWidget()
{
	// Controllers reference the session services and must go before them.
	for (const auto& controller : std::as_const(m_controllers))
		delete controller.data();
	m_controllers.clear();
}

GestureController* CanvasWidget::controllerFor(ObjectId id)
{
	if (auto existing = m_controllers.value(id))
		return existing;

	GestureServices services;
	services.document = &m_document;
	services.reconciler = &m_reconciler;
	services.presence = &m_session;
	services.arbiter = &m_arbiter;
	services.interaction = &m_interaction;
	services.viewport = &m_viewport;
	services.resolver = &m_resolver;
	services.settings = m_settings;

	auto* controller = new GestureController(id, services, std::make_unique<EventFilterPointerSession>(this), this);
	connect(controller, &GestureController::clicked, this, [this](ObjectId itemId) {
		m_session.selection().toggleSelection(itemId);
	});
	connect(controller, &GestureController::commitFailed, this,
			[](ObjectId itemId, GestureKind, const QString& message) {
				qCWarning(tandemgesturelog).noquote() << "gesture on" << itemId.value() << "rolled back:" << message;
			});
	m_controllers.insert(id, controller);
	return controller;
}

void CanvasWidget::syncOriginBounds()
{
	m_viewport.setOriginBounds(QRectF(mapToGlobal(QPointF(0.0, 0.0)), QSizeF(size())));
}

PointerEvent CanvasWidget::toPointerEvent(const QMouseEvent* e) const
{
	PointerEvent ev;
	ev.screenPos = e->globalPosition();
	ev.inputClass = InputClass::Mouse;
	ev.buttons = e->buttons();
	ev.modifiers = e->modifiers();
	return ev;
}

CanvasWidget::Hit CanvasWidget::hitItem(const QPointF& canvasPos) const
{
	auto test = [&](const TandemItem& item) -> Hit {
		const DisplayTransform t = m_resolver.resolve(item);
		const QRectF local(QPointF(0.0, 0.0), t.size);
		bool invertible = false;
		const QTransform inverse = itemTransform(t).inverted(&invertible);
		if (invertible && local.contains(inverse.map(canvasPos)))
			return Hit{&item, QRectF(t.position, t.size)};
		return {};
	};

	const auto& items = m_document.items();
	for (auto it = items.rbegin(); it != items.rend(); ++it) {
		const TandemItem& item = **it;
		if (const auto* group = item.contentAs<GroupContent>()) {
			const auto& children = group->children();
			for (auto c = children.rbegin(); c != children.rend(); ++c) {
				if (Hit hit = test(**c); hit.item)
					return hit;
			}
			const QPointF origin = m_resolver.groupPosition(item);
			const auto bounds = GroupGeometry::groupBounds(item, m_layout, m_resolver.settings(), origin);
			if (bounds.outline(m_resolver.settings().groupOutlinePadding).contains(canvasPos))
				return Hit{&item, bounds.rect};
			continue;
		}
		if (Hit hit = test(item); hit.item)
			return hit;
	}
	return {};
}

void CanvasWidget::mousePressEvent(QMouseEvent* e)
{
	setFocus(Qt::MouseFocusReason);
	syncOriginBounds();

	const PointerEvent ev = toPointerEvent(e);
	const QPointF canvas = m_viewport.toCanvas(ev.screenPos);
	const double zoom = m_viewport.zoom();

	// Rotation handles of locally selected items sit above their top edge.
	for (const ObjectId id : m_session.selection().selection()) {
		const TandemItem* item = m_document.findItem(id);
		if (!item || !m_resolver.canRotate(*item))
			continue;
		const DisplayTransform t = m_resolver.resolve(*item);
		const QPointF handle = itemTransform(t).map(
			QPointF(t.size.width() / 2.0, -kRotateHandleOffsetPx / zoom));
		if (QLineF(handle, canvas).length() <= kHandleRadiusPx * 2.0 / zoom) {
			controllerFor(id)->beginRotate(ev);
			e->accept();
			return;
		}
	}

	const Hit hit = hitItem(canvas);
	if (!hit.item) {
		if (!m_interaction.isBackgroundClearSuppressed())
			m_session.selection().clearSelection();
		e->accept();
		return;
	}

	GestureController* controller = controllerFor(hit.item->id());
	if (m_resolver.canResize(*hit.item)) {
		const DisplayTransform t = m_resolver.resolve(*hit.item);
		bool invertible = false;
		const QPointF local = itemTransform(t).inverted(&invertible).map(canvas);
		const double grab = kEdgeGrabPx / zoom;
		if (invertible) {
			if (hit.item->kind() == ContentKind::Text) {
				if (local.x() >= t.size.width() - grab && controller->beginResize(ev, ResizeHandle::RightEdge)) {
					e->accept();
					return;
				}
				if (local.x() <= grab && controller->beginResize(ev, ResizeHandle::LeftEdge)) {
					e->accept();
					return;
				}
			} else if (QLineF(local, QPointF(t.size.width(), t.size.height())).length() <= grab * 1.5
					   && controller->beginResize(ev, ResizeHandle::Corner)) {
				e->accept();
				return;
			}
		}
	}

	controller->pointerDown(ev, hit.item->kind() == ContentKind::Table);
	e->accept();
}

void CanvasWidget::wheelEvent(QWheelEvent* e)
{
	syncOriginBounds();
	if (e->modifiers() & Qt::ControlModifier) {
		const QPointF anchorScreen = e->globalPosition();
		const QPointF anchorCanvas = m_viewport.toCanvas(anchorScreen);
		const double factor = e->angleDelta().y() > 0 ? 1.1 : 1.0 / 1.1;
		m_viewport.setZoom(m_viewport.zoom() * factor);
		// Keep the canvas point under the cursor fixed.
		m_viewport.panBy(anchorScreen - m_viewport.fromCanvas(anchorCanvas));
	} else {
		m_viewport.panBy(QPointF(e->angleDelta()) / 4.0);
	}
	e->accept();
}

void CanvasWidget::keyPressEvent(QKeyEvent* e)
{
	if (e->key() == Qt::Key_Escape) {
		for (const auto& controller : std::as_const(m_controllers)) {
			if (controller && !controller->isIdle())
				controller->cancel();
		}
		m_session.selection().clearSelection();
		e->accept();
		return;
	}
	if (e->key() == Qt::Key_G) {
		for (const ObjectId id : m_session.selection().selection()) {
			const TandemItem* item = m_document.findItem(id);
			if (const auto* group = item ? item->contentAs<GroupContent>() : nullptr)
				m_document.setGroupViewAsGrid(id, !group->viewAsGrid());
		}
		e->accept();
		return;
	}
	QWidget::keyPressEvent(e);
}

void CanvasWidget::paintEvent(QPaintEvent* e)
{
	Q_UNUSED(e);

	QPainter p(this);
	p.setRenderHints(QPainter::Antialiasing | QPainter::TextAntialiasing, true);
	p.fillRect(rect(), kBackground);

	p.save();
	p.translate(m_viewport.pan());
	p.scale(m_viewport.zoom(), m_viewport.zoom());

	for (const auto& item : m_document.items()) {
		if (item->isGroup())
			drawGroup(p, *item);
		else
			drawItem(p, *item, m_resolver.resolve(*item));
	}
	p.restore();

	if (m_interaction.isManipulating()) {
		p.setPen(kLocalSelection);
		p.drawText(rect().adjusted(8, 8, -8, -8), Qt::AlignTop | Qt::AlignRight, u"editing"_s);
	}
}

void CanvasWidget::drawGroup(QPainter& p, const TandemItem& group)
{
	const auto* content = group.contentAs<GroupContent>();
	if (!content)
		return;

	for (const auto& child : content->children())
		drawItem(p, *child, m_resolver.resolve(*child));

	const TandemSettings& settings = m_resolver.settings();
	const QPointF origin = m_resolver.groupPosition(group);
	const GroupGeometry::GroupBounds bounds = GroupGeometry::groupBounds(group, m_layout, settings, origin);
	const QRectF outline = bounds.outline(settings.groupOutlinePadding);

	p.save();
	QPen pen(m_session.selection().testSelection(group.id()) ? kLocalSelection : kGroupOutline);
	pen.setWidthF(1.5 / m_viewport.zoom());
	pen.setStyle(Qt::DashLine);
	p.setPen(pen);
	p.setBrush(bounds.placeholder ? QColor(0, 0, 0, 12) : QColor(Qt::transparent));
	p.drawRoundedRect(outline, 12.0, 12.0);
	p.setPen(kGroupOutline);
	p.drawText(outline.topLeft() + QPointF(4.0, -6.0), content->name());
	p.restore();
}

void CanvasWidget::drawItem(QPainter& p, const TandemItem& item, const DisplayTransform& t)
{
	const QRectF local(QPointF(0.0, 0.0), t.size);
	// Rotation-free box, used to size the parent group outline.
	m_layout.setBounds(item.id(), QRectF(t.position, t.size));

	p.save();
	p.setTransform(itemTransform(t), true);
	if (t.manipulating)
		p.setOpacity(0.8);

	switch (item.kind()) {
		case ContentKind::Shape: {
			const auto* shape = item.contentAs<ShapeContent>();
			const QColor color(shape->color());
			p.setPen(QPen(color, 2.0));
			p.setBrush(shape->filled() ? color : QColor(Qt::transparent));
			switch (shape->shape()) {
				case ShapeKind::Circle: p.drawEllipse(local); break;
				case ShapeKind::Square:
				case ShapeKind::Rectangle: p.drawRect(local); break;
				case ShapeKind::Triangle:
					p.drawPolygon(QPolygonF({local.bottomLeft(), QPointF(local.center().x(), local.top()),
											 local.bottomRight()}));
					break;
				case ShapeKind::Star: p.drawPolygon(starPolygon(local)); break;
			}
			break;
		}
		case ContentKind::Note: {
			const auto* note = item.contentAs<NoteContent>();
			p.setPen(Qt::NoPen);
			p.setBrush(QColor(note->color()));
			p.drawRect(local);
			p.setPen(Qt::black);
			p.drawText(local.adjusted(10, 10, -10, -10), Qt::TextWordWrap, note->text());
			break;
		}
		case ContentKind::Text: {
			const auto* text = item.contentAs<TextContent>();
			QFont font = p.font();
			font.setPointSizeF(text->fontSize());
			p.setFont(font);
			p.setPen(text->color().isEmpty() ? QColor(Qt::black) : QColor(text->color()));
			p.drawText(local.adjusted(8, 8, -8, -8), Qt::TextWordWrap, text->text());
			break;
		}
		case ContentKind::Table: {
			const auto* table = item.contentAs<TableContent>();
			p.setPen(QPen(kGroupOutline, 1.0));
			p.setBrush(Qt::white);
			p.drawRect(local);
			const double cw = local.width() / std::max(1, table->columns());
			const double ch = local.height() / std::max(1, table->rows());
			for (int c = 1; c < table->columns(); ++c)
				p.drawLine(QPointF(c * cw, 0.0), QPointF(c * cw, local.height()));
			for (int r = 1; r < table->rows(); ++r)
				p.drawLine(QPointF(0.0, r * ch), QPointF(local.width(), r * ch));
			break;
		}
		case ContentKind::Group:
			break;
	}

	const bool selected = m_session.selection().testSelection(item.id());
	const bool remote = m_session.selection().testRemoteSelection(item.id())
		|| m_session.isRemotelyManipulated(item.id());
	if (selected || remote) {
		const double zoom = m_viewport.zoom();
		QPen pen(selected ? kLocalSelection : kRemoteSelection);
		pen.setWidthF(2.0 / zoom);
		p.setPen(pen);
		p.setBrush(Qt::NoBrush);
		p.drawRect(local.adjusted(-3.0 / zoom, -3.0 / zoom, 3.0 / zoom, 3.0 / zoom));

		if (selected && m_resolver.canRotate(item)) {
			const QPointF handle(local.center().x(), -kRotateHandleOffsetPx / zoom);
			p.drawLine(QPointF(local.center().x(), 0.0), handle);
			p.setBrush(Qt::white);
			p.drawEllipse(handle, kHandleRadiusPx / zoom, kHandleRadiusPx / zoom);
		}
		if (selected && m_resolver.canResize(item)) {
			p.setBrush(Qt::white);
			const double r = kHandleRadiusPx / zoom;
			if (item.kind() == ContentKind::Text) {
				p.drawRect(QRectF(QPointF(-r, local.center().y() - r), QSizeF(2 * r, 2 * r)));
				p.drawRect(QRectF(QPointF(local.right() - r, local.center().y() - r), QSizeF(2 * r, 2 * r)));
			} else {
				p.drawRect(QRectF(local.bottomRight() - QPointF(r, r), QSizeF(2 * r, 2 * r)));
			}
		}
	}
	p.restore();
}

} // namespace TandemApp
