// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "tandem/TandemGlobal.hpp"
#include "tandem/TandemSettings.hpp"

#include <QtCore/QPointF>
#include <QtCore/QSizeF>
#include <QtCore/QString>

#include <memory>
#include <optional>
#include <vector>

namespace Tandem {

class TandemItem;

enum class ContentKind : quint8 {
	Shape,
	Note,
	Text,
	Table,
	Group
};

enum class ShapeKind : quint8 {
	Circle,
	Square,
	Triangle,
	Star,
	Rectangle
};

enum class ResizeHandle : quint8 {
	Corner,
	LeftEdge,
	RightEdge
};

// Inputs of one resize step. Vectors are screen-space offsets from the item's
// screen center; `canvasDeltaX` is the horizontal pointer travel in canvas units.
struct TANDEM_EXPORT ResizeRequest final {
	ResizeHandle handle = ResizeHandle::Corner;
	QPointF startTopLeft;
	double startDimension = 0.0;
	QPointF initialVector;
	QPointF currentVector;
	double canvasDeltaX = 0.0;
};

struct TANDEM_EXPORT ResizeGeometry final {
	QPointF topLeft;
	double dimension = 0.0;
};

class TANDEM_EXPORT TandemContent
{
public:
	virtual ~TandemContent() = default;

	virtual ContentKind kind() const = 0;
	virtual QSizeF intrinsicSize() const = 0;
	virtual std::unique_ptr<TandemContent> clone() const = 0;

	// Copies the state of `snapshot` into this object without reallocating it.
	// False when `snapshot` holds a different kind of content.
	virtual bool restoreFrom(const TandemContent& snapshot) = 0;

	virtual bool canRotate() const { return true; }
	virtual bool canResize() const { return false; }

	// The single dimension a resize gesture changes (shape size, text width).
	virtual double resizableDimension() const { return 0.0; }
	virtual void setResizableDimension(double) {}

	virtual std::optional<ResizeGeometry> resize(const ResizeRequest& request,
												 const TandemSettings& settings) const
	{
		Q_UNUSED(request);
		Q_UNUSED(settings);
		return std::nullopt;
	}
};

class TANDEM_EXPORT ShapeContent final : public TandemContent
{
public:
	ShapeContent(ShapeKind shape, double size, QString color, bool filled = true);

	ShapeKind shape() const noexcept { return m_shape; }
	double size() const noexcept { return m_size; }
	void setSize(double size) { m_size = size; }
	const QString& color() const noexcept { return m_color; }
	bool filled() const noexcept { return m_filled; }

	ContentKind kind() const override { return ContentKind::Shape; }
	QSizeF intrinsicSize() const override { return QSizeF(m_size, m_size); }
	std::unique_ptr<TandemContent> clone() const override;
	bool restoreFrom(const TandemContent& snapshot) override;

	bool canResize() const override { return true; }
	double resizableDimension() const override { return m_size; }
	void setResizableDimension(double size) override { m_size = size; }

	// Uniform, center preserving: scale by the radial projection ratio.
	std::optional<ResizeGeometry> resize(const ResizeRequest& request,
										 const TandemSettings& settings) const override;

private:
	ShapeKind m_shape = ShapeKind::Square;
	double m_size = 0.0;
	QString m_color;
	bool m_filled = true;
};

class TANDEM_EXPORT NoteContent final : public TandemContent
{
public:
	NoteContent(QString text, QString color);

	const QString& text() const noexcept { return m_text; }
	const QString& color() const noexcept { return m_color; }

	ContentKind kind() const override { return ContentKind::Note; }
	QSizeF intrinsicSize() const override;
	std::unique_ptr<TandemContent> clone() const override;
	bool restoreFrom(const TandemContent& snapshot) override;

private:
	QString m_text;
	QString m_color;
};

class TANDEM_EXPORT TextContent final : public TandemContent
{
public:
	TextContent(QString text, double width, double fontSize, QString color = {});

	const QString& text() const noexcept { return m_text; }
	double width() const noexcept { return m_width; }
	void setWidth(double width) { m_width = width; }
	double fontSize() const noexcept { return m_fontSize; }
	const QString& color() const noexcept { return m_color; }

	ContentKind kind() const override { return ContentKind::Text; }
	QSizeF intrinsicSize() const override;
	std::unique_ptr<TandemContent> clone() const override;
	bool restoreFrom(const TandemContent& snapshot) override;

	bool canResize() const override { return true; }
	double resizableDimension() const override { return m_width; }
	void setResizableDimension(double width) override { m_width = width; }

	// Width only; the edge opposite the dragged handle stays anchored.
	std::optional<ResizeGeometry> resize(const ResizeRequest& request,
										 const TandemSettings& settings) const override;

private:
	QString m_text;
	double m_width = 0.0;
	double m_fontSize = 0.0;
	QString m_color;
};

class TANDEM_EXPORT TableContent final : public TandemContent
{
public:
	TableContent(int rows, int columns);

	int rows() const noexcept { return m_rows; }
	int columns() const noexcept { return m_columns; }

	ContentKind kind() const override { return ContentKind::Table; }
	QSizeF intrinsicSize() const override;
	std::unique_ptr<TandemContent> clone() const override;
	bool restoreFrom(const TandemContent& snapshot) override;

	bool canRotate() const override { return false; }

private:
	int m_rows = 0;
	int m_columns = 0;
};

class TANDEM_EXPORT GroupContent final : public TandemContent
{
public:
	explicit GroupContent(QString name, bool viewAsGrid = false);
	~GroupContent() override;

	const QString& name() const noexcept { return m_name; }
	bool viewAsGrid() const noexcept { return m_viewAsGrid; }
	void setViewAsGrid(bool grid) { m_viewAsGrid = grid; }

	const std::vector<std::unique_ptr<TandemItem>>& children() const { return m_children; }
	std::vector<std::unique_ptr<TandemItem>>& children() { return m_children; }

	// -1 when `child` is not a direct child.
	int indexOf(const TandemItem* child) const;

	ContentKind kind() const override { return ContentKind::Group; }
	QSizeF intrinsicSize() const override { return QSizeF(); }
	std::unique_ptr<TandemContent> clone() const override;
	bool restoreFrom(const TandemContent& snapshot) override;

	bool canRotate() const override { return false; }

private:
	QString m_name;
	bool m_viewAsGrid = false;
	std::vector<std::unique_ptr<TandemItem>> m_children;
};

} // namespace Tandem
