#include "tandem/document/TandemContent.hpp"

#include "tandem/Tools.hpp"
#include "tandem/document/TandemItem.hpp"

#include <algorithm>
#include <utility>

namespace Tandem {

namespace {

constexpr double kNoteSide = 200.0;
constexpr double kTableCellWidth = 96.0;
constexpr double kTableCellHeight = 32.0;

// Line box plus vertical padding of a single-line text block.
constexpr double kTextLineFactor = 1.4;
constexpr double kTextPadding = 16.0;

} // namespace

// ---------------------------------------------------------------------------
// ShapeContent
// ---------------------------------------------------------------------------

ShapeContent::ShapeContent(ShapeKind shape, double size, QString color, bool filled)
	: m_shape(shape)
	, m_size(size)
	, m_color(std::move(color))
	, m_filled(filled)
{}

std::unique_ptr<TandemContent> ShapeContent::clone() const
{
	return std::make_unique<ShapeContent>(*this);
}

bool ShapeContent::restoreFrom(const TandemContent& snapshot)
{
	const auto* other = dynamic_cast<const ShapeContent*>(&snapshot);
	if (!other)
		return false;
	*this = *other;
	return true;
}

std::optional<ResizeGeometry> ShapeContent::resize(const ResizeRequest& request,
												   const TandemSettings& settings) const
{
	const double ratio = Tools::Math::projectedRatio(request.initialVector,
													 request.currentVector,
													 settings.resizeMinRatio);
	const double size = settings.clampShapeSize(request.startDimension * ratio);

	const QPointF center = request.startTopLeft
						   + QPointF(request.startDimension / 2.0, request.startDimension / 2.0);
	return ResizeGeometry{center - QPointF(size / 2.0, size / 2.0), size};
}

// ---------------------------------------------------------------------------
// NoteContent
// ---------------------------------------------------------------------------

NoteContent::NoteContent(QString text, QString color)
	: m_text(std::move(text))
	, m_color(std::move(color))
{}

QSizeF NoteContent::intrinsicSize() const
{
	return QSizeF(kNoteSide, kNoteSide);
}

std::unique_ptr<TandemContent> NoteContent::clone() const
{
	return std::make_unique<NoteContent>(*this);
}

bool NoteContent::restoreFrom(const TandemContent& snapshot)
{
	const auto* other = dynamic_cast<const NoteContent*>(&snapshot);
	if (!other)
		return false;
	*this = *other;
	return true;
}

// ---------------------------------------------------------------------------
// TextContent
// ---------------------------------------------------------------------------

TextContent::TextContent(QString text, double width, double fontSize, QString color)
	: m_text(std::move(text))
	, m_width(width)
	, m_fontSize(fontSize)
	, m_color(std::move(color))
{}

QSizeF TextContent::intrinsicSize() const
{
	return QSizeF(m_width, m_fontSize * kTextLineFactor + kTextPadding);
}

std::unique_ptr<TandemContent> TextContent::clone() const
{
	return std::make_unique<TextContent>(*this);
}

bool TextContent::restoreFrom(const TandemContent& snapshot)
{
	const auto* other = dynamic_cast<const TextContent*>(&snapshot);
	if (!other)
		return false;
	*this = *other;
	return true;
}

std::optional<ResizeGeometry> TextContent::resize(const ResizeRequest& request,
												  const TandemSettings& settings) const
{
	switch (request.handle) {
		case ResizeHandle::RightEdge: {
			const double width = settings.clampTextWidth(request.startDimension + request.canvasDeltaX);
			return ResizeGeometry{request.startTopLeft, width};
		}
		case ResizeHandle::LeftEdge: {
			const double width = settings.clampTextWidth(request.startDimension - request.canvasDeltaX);
			const QPointF topLeft(request.startTopLeft.x() + (request.startDimension - width),
								  request.startTopLeft.y());
			return ResizeGeometry{topLeft, width};
		}
		case ResizeHandle::Corner:
			break;
	}
	return std::nullopt;
}

// ---------------------------------------------------------------------------
// TableContent
// ---------------------------------------------------------------------------

TableContent::TableContent(int rows, int columns)
	: m_rows(std::max(1, rows))
	, m_columns(std::max(1, columns))
{}

QSizeF TableContent::intrinsicSize() const
{
	return QSizeF(m_columns * kTableCellWidth, m_rows * kTableCellHeight);
}

std::unique_ptr<TandemContent> TableContent::clone() const
{
	return std::make_unique<TableContent>(*this);
}

bool TableContent::restoreFrom(const TandemContent& snapshot)
{
	const auto* other = dynamic_cast<const TableContent*>(&snapshot);
	if (!other)
		return false;
	*this = *other;
	return true;
}

// ---------------------------------------------------------------------------
// GroupContent
// ---------------------------------------------------------------------------

GroupContent::GroupContent(QString name, bool viewAsGrid)
	: m_name(std::move(name))
	, m_viewAsGrid(viewAsGrid)
{}

GroupContent::~GroupContent() = default;

int GroupContent::indexOf(const TandemItem* child) const
{
	for (size_t i = 0; i < m_children.size(); ++i) {
		if (m_children[i].get() == child)
			return static_cast<int>(i);
	}
	return -1;
}

std::unique_ptr<TandemContent> GroupContent::clone() const
{
	auto copy = std::make_unique<GroupContent>(m_name, m_viewAsGrid);
	copy->m_children.reserve(m_children.size());
	for (const auto& child : m_children)
		copy->m_children.push_back(child->clone());
	return copy;
}

bool GroupContent::restoreFrom(const TandemContent& snapshot)
{
	const auto* other = dynamic_cast<const GroupContent*>(&snapshot);
	if (!other)
		return false;

	m_name = other->m_name;
	m_viewAsGrid = other->m_viewAsGrid;

	// Children that survive keep their address; ones the snapshot lacks are dropped.
	std::vector<std::unique_ptr<TandemItem>> restored;
	restored.reserve(other->m_children.size());
	for (const auto& saved : other->m_children) {
		auto it = std::find_if(m_children.begin(), m_children.end(), [&saved](const auto& child) {
			return child && child->id() == saved->id();
		});
		if (it != m_children.end()) {
			(*it)->restoreFrom(*saved);
			restored.push_back(std::move(*it));
		} else {
			restored.push_back(saved->clone());
		}
	}
	m_children = std::move(restored);
	return true;
}

} // namespace Tandem
