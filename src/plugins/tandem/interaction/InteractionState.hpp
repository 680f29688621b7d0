// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "tandem/TandemGlobal.hpp"

#include <QtCore/QElapsedTimer>
#include <QtCore/QObject>

#include <functional>

namespace Tandem {

// Session-wide interaction flags read by background logic: whether any
// gesture is manipulating an item, and whether the click that ends a gesture
// must not clear the selection.
class TANDEM_EXPORT InteractionState final : public QObject
{
	Q_OBJECT

public:
	// Milliseconds on a monotonic clock.
	using Clock = std::function<qint64()>;

	explicit InteractionState(QObject* parent = nullptr);

	bool isManipulating() const noexcept { return m_manipulators > 0; }
	void beginManipulation();
	void endManipulation();

	void suppressBackgroundClear(int durationMs);
	bool isBackgroundClearSuppressed() const;

	void setClock(Clock clock);

signals:
	void manipulatingChanged(bool manipulating);

private:
	qint64 now() const;

	int m_manipulators = 0;
	qint64 m_suppressUntil = -1;
	QElapsedTimer m_timer;
	Clock m_clock;
};

} // namespace Tandem
