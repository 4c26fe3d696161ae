// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include "core/cardparser.h"

using namespace XNotid;

/**
 * @brief Unit tests for CardParser
 *
 * Tests cover:
 * - Plain bodies and foreign JSON are not cards
 * - Permission and multiple-choice decoding
 * - Malformed envelopes
 * - Response encoding and validation
 */
class TestCardParser : public QObject
{
    Q_OBJECT

private:
    static Card choiceCard(bool allowOther)
    {
        Card card;
        card.kind = Card::Kind::MultipleChoice;
        card.question = QStringLiteral("Pick");
        card.choices = {{QStringLiteral("a"), QStringLiteral("Alpha")}, {QStringLiteral("b"), QStringLiteral("Beta")}};
        card.allowOther = allowOther;
        return card;
    }

private Q_SLOTS:
    // ═══════════════════════════════════════════════════════════════════════════
    // Not a card
    // ═══════════════════════════════════════════════════════════════════════════

    void testParse_plainText_notACard()
    {
        const CardParseResult result = CardParser::parse(QStringLiteral("Build finished in 3 minutes"));
        QCOMPARE(result.status, CardParseResult::Status::NotACard);
        QVERIFY(!result.card.has_value());
    }

    void testParse_jsonWithoutMarker_notACard()
    {
        const CardParseResult result =
            CardParser::parse(QStringLiteral(R"({"type": "permission", "question": "Run?"})"));
        QCOMPARE(result.status, CardParseResult::Status::NotACard);
    }

    void testParse_wrongMarkerVersion_notACard()
    {
        const CardParseResult result = CardParser::parse(
            QStringLiteral(R"({"xnotid_card": "v2", "type": "permission", "question": "Run?"})"));
        QCOMPARE(result.status, CardParseResult::Status::NotACard);
    }

    void testParse_invalidJson_notACard()
    {
        const CardParseResult result = CardParser::parse(QStringLiteral(R"({"xnotid_card": "v1", )"));
        QCOMPARE(result.status, CardParseResult::Status::NotACard);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Valid cards
    // ═══════════════════════════════════════════════════════════════════════════

    void testParse_permission_defaultAllowLabel()
    {
        const CardParseResult result = CardParser::parse(
            QStringLiteral(R"({"xnotid_card": "v1", "type": "permission", "question": "Run tests?"})"));
        QVERIFY(result.isCard());
        QVERIFY(result.card->isPermission());
        QCOMPARE(result.card->question, QStringLiteral("Run tests?"));
        QCOMPARE(result.card->allowLabel, QStringLiteral("Allow"));
    }

    void testParse_permission_customAllowLabel()
    {
        const CardParseResult result = CardParser::parse(QStringLiteral(
            R"(  {"xnotid_card": "v1", "type": "permission", "question": "Deploy?", "allow_label": "Ship it"}  )"));
        QVERIFY(result.isCard());
        QCOMPARE(result.card->allowLabel, QStringLiteral("Ship it"));
    }

    void testParse_multipleChoice_keepsChoiceOrder()
    {
        const CardParseResult result = CardParser::parse(QStringLiteral(
            R"({"xnotid_card": "v1", "type": "multiple-choice", "question": "Which branch?",)"
            R"( "choices": [{"id": "main", "label": "Main"}, {"id": "dev", "label": "Develop"}],)"
            R"( "allow_other": true})"));
        QVERIFY(result.isCard());
        QVERIFY(result.card->isMultipleChoice());
        QCOMPARE(result.card->choices.size(), 2);
        QCOMPARE(result.card->choices.at(0).id, QStringLiteral("main"));
        QCOMPARE(result.card->choices.at(1).label, QStringLiteral("Develop"));
        QVERIFY(result.card->allowOther);
    }

    void testParse_multipleChoice_allowOtherDefaultsFalse()
    {
        const CardParseResult result = CardParser::parse(
            QStringLiteral(R"({"xnotid_card": "v1", "type": "multiple-choice", "question": "Q",)"
                           R"( "choices": [{"id": "a", "label": "A"}]})"));
        QVERIFY(result.isCard());
        QVERIFY(!result.card->allowOther);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Malformed cards
    // ═══════════════════════════════════════════════════════════════════════════

    void testParse_malformed_data()
    {
        QTest::addColumn<QString>("body");

        QTest::newRow("missing question") << QStringLiteral(R"({"xnotid_card": "v1", "type": "permission"})");
        QTest::newRow("blank question")
            << QStringLiteral(R"({"xnotid_card": "v1", "type": "permission", "question": "   "})");
        QTest::newRow("unknown type")
            << QStringLiteral(R"({"xnotid_card": "v1", "type": "slider", "question": "Q"})");
        QTest::newRow("no choices")
            << QStringLiteral(R"({"xnotid_card": "v1", "type": "multiple-choice", "question": "Q"})");
        QTest::newRow("empty choices") << QStringLiteral(
            R"({"xnotid_card": "v1", "type": "multiple-choice", "question": "Q", "choices": []})");
        QTest::newRow("choice not an object") << QStringLiteral(
            R"({"xnotid_card": "v1", "type": "multiple-choice", "question": "Q", "choices": ["a"]})");
        QTest::newRow("choice without label") << QStringLiteral(
            R"({"xnotid_card": "v1", "type": "multiple-choice", "question": "Q", "choices": [{"id": "a"}]})");
        QTest::newRow("duplicate ids") << QStringLiteral(
            R"({"xnotid_card": "v1", "type": "multiple-choice", "question": "Q",)"
            R"( "choices": [{"id": "a", "label": "A"}, {"id": "a", "label": "B"}]})");
    }

    void testParse_malformed()
    {
        QFETCH(QString, body);
        const CardParseResult result = CardParser::parse(body);
        QVERIFY(result.isMalformed());
        QVERIFY(!result.card.has_value());
        QVERIFY(!result.error.isEmpty());
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Responses
    // ═══════════════════════════════════════════════════════════════════════════

    void testPermission_onlyAllowIsValid()
    {
        Card card;
        card.kind = Card::Kind::Permission;
        card.question = QStringLiteral("Run?");

        QCOMPARE(CardParser::permissionResponseKey(), QStringLiteral("allow"));
        QVERIFY(CardParser::isValidResponse(card, QStringLiteral("allow")));
        QVERIFY(!CardParser::isValidResponse(card, QStringLiteral("deny")));
        QVERIFY(!CardParser::isValidResponse(card, QString()));
    }

    void testChoiceResponse_resolvesLabelsInCardOrder()
    {
        const Card card = choiceCard(false);
        const QString key = CardParser::buildChoiceResponse(card, {QStringLiteral("b"), QStringLiteral("a")});

        const QJsonObject response = QJsonDocument::fromJson(key.toUtf8()).object();
        QCOMPARE(response.value(QLatin1String("type")).toString(), QStringLiteral("multiple-choice"));

        const QJsonArray selected = response.value(QLatin1String("selected")).toArray();
        QCOMPARE(selected.size(), 2);
        QCOMPARE(selected.at(0).toObject().value(QLatin1String("id")).toString(), QStringLiteral("a"));
        QCOMPARE(selected.at(0).toObject().value(QLatin1String("label")).toString(), QStringLiteral("Alpha"));
        QCOMPARE(selected.at(1).toObject().value(QLatin1String("id")).toString(), QStringLiteral("b"));
        QVERIFY(response.value(QLatin1String("other")).isNull());

        QVERIFY(CardParser::isValidResponse(card, key));
    }

    void testChoiceResponse_otherOnlyWhenAllowed()
    {
        const QString withOther =
            CardParser::buildChoiceResponse(choiceCard(true), {}, QStringLiteral("  something else  "));
        const QJsonObject response = QJsonDocument::fromJson(withOther.toUtf8()).object();
        QCOMPARE(response.value(QLatin1String("other")).toString(), QStringLiteral("something else"));
        QVERIFY(CardParser::isValidResponse(choiceCard(true), withOther));

        // Same text on a card that doesn't allow it is dropped
        const QString dropped = CardParser::buildChoiceResponse(choiceCard(false), {QStringLiteral("a")},
                                                                QStringLiteral("extra"));
        QVERIFY(QJsonDocument::fromJson(dropped.toUtf8()).object().value(QLatin1String("other")).isNull());

        // And a hand-written response carrying it is rejected
        QVERIFY(!CardParser::isValidResponse(choiceCard(false), withOther));
    }

    void testChoiceResponse_rejectsUnknownOrEmpty()
    {
        const Card card = choiceCard(false);
        QVERIFY(!CardParser::isValidResponse(
            card, QStringLiteral(R"({"type":"multiple-choice","selected":[{"id":"zzz","label":"Z"}],"other":null})")));
        QVERIFY(!CardParser::isValidResponse(card,
                                             QStringLiteral(R"({"type":"multiple-choice","selected":[],"other":null})")));
        QVERIFY(!CardParser::isValidResponse(card, QStringLiteral("allow")));
        QVERIFY(!CardParser::isValidResponse(card, QStringLiteral("not json")));
    }
};

QTEST_MAIN(TestCardParser)
#include "test_card_parser.moc"
