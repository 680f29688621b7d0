// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "tandem/TandemGlobal.hpp"
#include "tandem/TandemTypes.hpp"

#include <utils/Result.hpp>

#include <QtCore/QObject>
#include <QtCore/QString>

#include <functional>

namespace Tandem {

class TandemItem;

namespace Api {

// Mutable view handed to a transaction body. Only the scope node and its
// descendants are reachable; anything else resolves to nullptr.
class TANDEM_EXPORT ITransactionScope
{
public:
    virtual ~ITransactionScope() = default;

    virtual ObjectId scopeId() const = 0;
    virtual TandemItem* item(ObjectId id) = 0;
};

using TransactionBody = std::function<Utils::Result(ITransactionScope&)>;

// Persisted shared tree. Every multi-field write goes through runTransaction,
// which applies all of the body's edits or none of them.
class TANDEM_EXPORT ITandemDocument : public QObject
{
    Q_OBJECT

public:
    using QObject::QObject;
    ~ITandemDocument() override = default;

    virtual TandemItem* findItem(ObjectId id) const = 0;

    // The group item directly containing `id`, nullptr for top-level items.
    virtual TandemItem* parentOf(ObjectId id) const = 0;

    virtual Utils::Result runTransaction(ObjectId scope,
                                         const QString& label,
                                         const TransactionBody& body) = 0;
    virtual bool inTransaction() const = 0;

signals:
    void transactionCommitted(const QString& label, Tandem::ObjectId scope);
    void transactionRejected(const QString& label, Tandem::ObjectId scope, const QString& message);
    void changed();
};

} // namespace Api
} // namespace Tandem
