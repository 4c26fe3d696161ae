// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cardparser.h"
#include "constants.h"
#include "logging.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QSet>

namespace XNotid {

namespace {

CardParseResult malformed(const QString& error)
{
    CardParseResult result;
    result.status = CardParseResult::Status::Malformed;
    result.error = error;
    return result;
}

bool readRequiredString(const QJsonObject& obj, QLatin1String key, QString& out)
{
    const QJsonValue value = obj.value(key);
    if (!value.isString()) {
        return false;
    }
    out = value.toString();
    return !out.trimmed().isEmpty();
}

} // namespace

CardParseResult CardParser::parse(const QString& body)
{
    const QString trimmed = body.trimmed();
    if (!trimmed.startsWith(QLatin1Char('{'))) {
        return {};
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(trimmed.toUtf8(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        return {};
    }

    const QJsonObject root = doc.object();
    if (root.value(CardKeys::Marker).toString() != CardKeys::MarkerVersion) {
        return {};
    }

    Card card;
    if (!readRequiredString(root, CardKeys::Question, card.question)) {
        return malformed(QStringLiteral("missing or empty \"question\""));
    }

    const QString type = root.value(CardKeys::Type).toString();
    if (type == CardKeys::TypePermission) {
        card.kind = Card::Kind::Permission;
        const QString allowLabel = root.value(CardKeys::AllowLabel).toString().trimmed();
        card.allowLabel = allowLabel.isEmpty() ? QStringLiteral("Allow") : allowLabel;
    } else if (type == CardKeys::TypeMultipleChoice) {
        card.kind = Card::Kind::MultipleChoice;

        const QJsonValue choicesValue = root.value(CardKeys::Choices);
        if (!choicesValue.isArray()) {
            return malformed(QStringLiteral("missing \"choices\" array"));
        }
        const QJsonArray choices = choicesValue.toArray();
        if (choices.isEmpty()) {
            return malformed(QStringLiteral("empty \"choices\" array"));
        }

        QSet<QString> seenIds;
        for (const QJsonValue& choiceValue : choices) {
            if (!choiceValue.isObject()) {
                return malformed(QStringLiteral("choice is not an object"));
            }
            const QJsonObject choiceObj = choiceValue.toObject();
            CardChoice choice;
            if (!readRequiredString(choiceObj, CardKeys::Id, choice.id)
                || !readRequiredString(choiceObj, CardKeys::Label, choice.label)) {
                return malformed(QStringLiteral("choice without \"id\" or \"label\""));
            }
            if (seenIds.contains(choice.id)) {
                return malformed(QStringLiteral("duplicate choice id \"%1\"").arg(choice.id));
            }
            seenIds.insert(choice.id);
            card.choices.append(choice);
        }

        card.allowOther = root.value(CardKeys::AllowOther).toBool(false);
    } else {
        return malformed(QStringLiteral("unknown card type \"%1\"").arg(type));
    }

    CardParseResult result;
    result.status = CardParseResult::Status::Card;
    result.card = card;
    return result;
}

QString CardParser::permissionResponseKey()
{
    return QString(CardKeys::AllowAction);
}

QString CardParser::buildChoiceResponse(const Card& card, const QStringList& selectedIds, const QString& otherText)
{
    QJsonArray selected;
    for (const CardChoice& choice : card.choices) {
        if (selectedIds.contains(choice.id)) {
            QJsonObject obj;
            obj[CardKeys::Id] = choice.id;
            obj[CardKeys::Label] = choice.label;
            selected.append(obj);
        }
    }

    const QString other = otherText.trimmed();

    QJsonObject response;
    response[CardKeys::Type] = QString(CardKeys::TypeMultipleChoice);
    response[CardKeys::Selected] = selected;
    response[CardKeys::Other] = (card.allowOther && !other.isEmpty()) ? QJsonValue(other) : QJsonValue(QJsonValue::Null);

    return QString::fromUtf8(QJsonDocument(response).toJson(QJsonDocument::Compact));
}

bool CardParser::isValidResponse(const Card& card, const QString& actionKey)
{
    if (card.isPermission()) {
        return actionKey == CardKeys::AllowAction;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(actionKey.toUtf8(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        return false;
    }

    const QJsonObject response = doc.object();
    if (response.value(CardKeys::Type).toString() != CardKeys::TypeMultipleChoice) {
        return false;
    }

    const QJsonValue selectedValue = response.value(CardKeys::Selected);
    if (!selectedValue.isArray()) {
        return false;
    }

    QSet<QString> knownIds;
    for (const CardChoice& choice : card.choices) {
        knownIds.insert(choice.id);
    }

    const QJsonArray selected = selectedValue.toArray();
    for (const QJsonValue& entry : selected) {
        const QString id = entry.toObject().value(CardKeys::Id).toString();
        if (!knownIds.contains(id)) {
            qCDebug(lcCard) << "Response selects unknown choice" << id;
            return false;
        }
    }

    const QJsonValue other = response.value(CardKeys::Other);
    if (other.isString()) {
        if (!card.allowOther) {
            return false;
        }
    } else if (!other.isNull() && !other.isUndefined()) {
        return false;
    }

    return !selected.isEmpty() || other.isString();
}

} // namespace XNotid
