#pragma once

#include "tandem/TandemGlobal.hpp"

#include <QtCore/QObject>
#include <QtCore/QPointF>
#include <QtCore/QRectF>

#include <optional>

namespace Tandem {

// Pan/zoom state of one document view. `originBounds` is the screen rectangle
// of the canvas element; it may be unknown while the view is not laid out.
class TANDEM_EXPORT TandemViewport final : public QObject
{
	Q_OBJECT

public:
	explicit TandemViewport(QObject* parent = nullptr);

	double zoom() const noexcept { return m_zoom; }
	void setZoom(double zoom);

	QPointF pan() const noexcept { return m_pan; }
	void setPan(const QPointF& pan);
	void panBy(const QPointF& delta) { setPan(m_pan + delta); }

	const std::optional<QRectF>& originBounds() const noexcept { return m_originBounds; }
	void setOriginBounds(const QRectF& bounds);
	void clearOriginBounds();

	QPointF toCanvas(const QPointF& screenPos) const;
	QPointF fromCanvas(const QPointF& canvasPos) const;

signals:
	void zoomChanged(double zoom);
	void panChanged(const QPointF& pan);
	void originBoundsChanged();

private:
	double m_zoom = 1.0;
	QPointF m_pan{0.0, 0.0};
	std::optional<QRectF> m_originBounds;
};

} // namespace Tandem
