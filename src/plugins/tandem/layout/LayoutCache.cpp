#include "tandem/layout/LayoutCache.hpp"

namespace Tandem {

void LayoutCache::setBounds(ObjectId id, const QRectF& bounds)
{
	if (!id || !bounds.isValid())
		return;
	m_bounds.insert(id, bounds);
}

std::optional<QRectF> LayoutCache::bounds(ObjectId id) const
{
	const auto it = m_bounds.constFind(id);
	if (it == m_bounds.cend())
		return std::nullopt;
	return *it;
}

} // namespace Tandem
