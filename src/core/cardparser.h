// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "xnotid_export.h"
#include "types.h"
#include <QString>
#include <QStringList>
#include <optional>

namespace XNotid {

/**
 * @brief Outcome of decoding a notification body as a card envelope
 */
struct CardParseResult
{
    enum class Status {
        NotACard, ///< No marker, wrong marker version or not a JSON object
        Card,     ///< Valid card, see @c card
        Malformed ///< Marker present but the payload is invalid, see @c error
    };

    Status status = Status::NotACard;
    std::optional<XNotid::Card> card;
    QString error;

    bool isCard() const
    {
        return status == Status::Card;
    }
    bool isMalformed() const
    {
        return status == Status::Malformed;
    }
};

/**
 * @brief Decoder and validator for the xnotid card envelope
 *
 * A card is a JSON object embedded in the notification body:
 * @code
 * {"xnotid_card": "v1", "type": "permission", "question": "Run tests?", "allow_label": "Run"}
 * {"xnotid_card": "v1", "type": "multiple-choice", "question": "Pick",
 *  "choices": [{"id": "a", "label": "A"}], "allow_other": true}
 * @endcode
 *
 * All functions are pure.
 */
class XNOTID_EXPORT CardParser
{
public:
    static CardParseResult parse(const QString& body);

    /**
     * @brief Action key emitted when a permission card is allowed
     */
    static QString permissionResponseKey();

    /**
     * @brief Build the compact JSON action key answering a multiple-choice card
     *
     * Selected ids are resolved to their labels in card order. Unknown ids are
     * skipped. @p otherText is only carried when the card allows it and it is
     * non-empty after trimming.
     */
    static QString buildChoiceResponse(const Card& card, const QStringList& selectedIds,
                                       const QString& otherText = QString());

    /**
     * @brief Check whether @p actionKey is an acceptable answer to @p card
     */
    static bool isValidResponse(const Card& card, const QString& actionKey);

private:
    CardParser() = delete;
};

} // namespace XNotid
