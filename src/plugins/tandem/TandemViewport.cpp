#include "tandem/TandemViewport.hpp"

#include "tandem/Tools.hpp"

namespace Tandem {

TandemViewport::TandemViewport(QObject* parent)
	: QObject(parent)
{
	m_zoom = Tools::Math::clampZoom(1.0);
}

void TandemViewport::setZoom(double zoom)
{
	const double clamped = Tools::Math::clampZoom(zoom);
	if (qFuzzyCompare(m_zoom, clamped))
		return;
	m_zoom = clamped;
	emit zoomChanged(m_zoom);
}

void TandemViewport::setPan(const QPointF& pan)
{
	if (m_pan == pan)
		return;
	m_pan = pan;
	emit panChanged(m_pan);
}

void TandemViewport::setOriginBounds(const QRectF& bounds)
{
	if (m_originBounds && *m_originBounds == bounds)
		return;
	m_originBounds = bounds;
	emit originBoundsChanged();
}

void TandemViewport::clearOriginBounds()
{
	if (!m_originBounds)
		return;
	m_originBounds.reset();
	emit originBoundsChanged();
}

QPointF TandemViewport::toCanvas(const QPointF& screenPos) const
{
	return Tools::Math::toCanvas(screenPos, m_pan, m_zoom, m_originBounds);
}

QPointF TandemViewport::fromCanvas(const QPointF& canvasPos) const
{
	return Tools::Math::fromCanvas(canvasPos, m_pan, m_zoom, m_originBounds);
}

} // namespace Tandem
