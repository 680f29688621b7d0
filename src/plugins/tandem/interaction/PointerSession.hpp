// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "tandem/TandemGlobal.hpp"
#include "tandem/TandemTypes.hpp"

#include <QtCore/QObject>
#include <QtCore/QPointF>
#include <QtCore/QPointer>

#include <functional>

QT_BEGIN_NAMESPACE
class QWidget;
QT_END_NAMESPACE

namespace Tandem {

// Platform-neutral pointer sample in screen coordinates.
struct TANDEM_EXPORT PointerEvent final {
	QPointF screenPos;
	InputClass inputClass = InputClass::Mouse;
	int pointerId = 0;
	Qt::MouseButtons buttons = Qt::NoButton;
	Qt::KeyboardModifiers modifiers = Qt::NoModifier;
};

// Delivers the move/end stream of one gesture regardless of which element
// the pointer is over.
class TANDEM_EXPORT IPointerSession
{
public:
	using MoveHandler = std::function<void(const PointerEvent& event)>;
	using EndHandler = std::function<void(const PointerEvent& event, bool cancelled)>;

	virtual ~IPointerSession() = default;

	// False when capture is unavailable; listeners still receive events.
	virtual bool capture(int pointerId) = 0;
	virtual void release() = 0;
	virtual bool isCaptured() const = 0;

	virtual void attach(MoveHandler onMove, EndHandler onEnd) = 0;
	virtual void detach() = 0;
	virtual bool isAttached() const = 0;
};

// Events are pushed by the host, e.g. from a widget's own event handlers.
class TANDEM_EXPORT ManualPointerSession final : public IPointerSession
{
public:
	bool capture(int pointerId) override;
	void release() override;
	bool isCaptured() const override { return m_captured; }

	void attach(MoveHandler onMove, EndHandler onEnd) override;
	void detach() override;
	bool isAttached() const override { return static_cast<bool>(m_onMove) || static_cast<bool>(m_onEnd); }

	void setCaptureAvailable(bool available) { m_captureAvailable = available; }
	int capturedPointer() const noexcept { return m_pointerId; }

	void dispatchMove(const PointerEvent& event);
	void dispatchEnd(const PointerEvent& event);
	void dispatchCancel(const PointerEvent& event);

private:
	MoveHandler m_onMove;
	EndHandler m_onEnd;
	bool m_captureAvailable = true;
	bool m_captured = false;
	int m_pointerId = -1;
};

// Listens application-wide through an event filter on the QCoreApplication
// instance, and grabs the mouse on `captureTarget` when one is set.
class TANDEM_EXPORT EventFilterPointerSession final : public QObject, public IPointerSession
{
	Q_OBJECT

public:
	explicit EventFilterPointerSession(QWidget* captureTarget = nullptr, QObject* parent = nullptr);
	~EventFilterPointerSession() override;

	bool capture(int pointerId) override;
	void release() override;
	bool isCaptured() const override { return m_captured; }

	void attach(MoveHandler onMove, EndHandler onEnd) override;
	void detach() override;
	bool isAttached() const override { return m_installed; }

protected:
	bool eventFilter(QObject* watched, QEvent* event) override;

private:
	void finish(const PointerEvent& event, bool cancelled);

	QPointer<QWidget> m_captureTarget;
	MoveHandler m_onMove;
	EndHandler m_onEnd;
	bool m_installed = false;
	bool m_captured = false;
	int m_pointerId = -1;
};

} // namespace Tandem
