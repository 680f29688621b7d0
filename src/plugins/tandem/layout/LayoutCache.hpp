#pragma once

#include "tandem/TandemGlobal.hpp"
#include "tandem/TandemTypes.hpp"

#include <QtCore/QHash>
#include <QtCore/QRectF>

#include <optional>

namespace Tandem {

// Last measured canvas-space bounding box of each rendered item.
class TANDEM_EXPORT LayoutCache final
{
public:
	void setBounds(ObjectId id, const QRectF& bounds);
	void remove(ObjectId id) { m_bounds.remove(id); }
	void clear() { m_bounds.clear(); }

	std::optional<QRectF> bounds(ObjectId id) const;
	bool contains(ObjectId id) const { return m_bounds.contains(id); }
	qsizetype size() const { return m_bounds.size(); }

private:
	QHash<ObjectId, QRectF> m_bounds;
};

} // namespace Tandem
