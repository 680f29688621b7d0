// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QString>
#include <QtCore/QStringList>

#include <utility>

namespace Utils {

enum class ResultCode : quint8 {
	None = 0,
	InvalidArgument,
	MissingItem,
	Rejected,
	IoError,
	Unknown
};

struct Result {
	bool ok = true;
	ResultCode code = ResultCode::None;
	QStringList errors;

	static Result success() { return Result{}; }

	static Result failure(ResultCode code, const QString& msg)
	{
		Result r;
		r.ok = false;
		r.code = code;
		r.errors.push_back(msg);
		return r;
	}

	static Result failure(const QString& msg) { return failure(ResultCode::Unknown, msg); }

	void addError(ResultCode c, const QString& msg)
	{
		if (ok)
			code = c;
		ok = false;
		errors.push_back(msg);
	}

	QString message() const { return errors.join(QStringLiteral("; ")); }

	explicit operator bool() const { return ok; }
};

} // namespace Utils
