// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QSignalSpy>

#include "core/notificationengine.h"
#include "dbus/controladaptor.h"
#include "recordingsurface.h"

using namespace XNotid;

/**
 * @brief Tests for the org.xnotid.Control adaptor
 *
 * The adaptor slots are called directly; no session bus is needed.
 */
class TestControlAdaptor : public QObject
{
    Q_OBJECT

private:
    struct Fixture
    {
        RecordingSurface surface;
        QObject host;
        NotificationEngine engine{EngineConfig{}, &surface};
        ControlAdaptor* adaptor = new ControlAdaptor(&engine, &host);
    };

private Q_SLOTS:
    void testToggleCenter()
    {
        Fixture f;
        f.adaptor->ToggleCenter();
        QVERIFY(f.engine.isCenterVisible());
        QVERIFY(f.surface.centerVisible);

        f.adaptor->ToggleCenter();
        QVERIFY(!f.engine.isCenterVisible());
    }

    void testDoNotDisturb_setAndToggle()
    {
        Fixture f;
        QSignalSpy changedSpy(f.adaptor, &ControlAdaptor::DoNotDisturbChanged);

        QVERIFY(!f.adaptor->DoNotDisturb());
        f.adaptor->SetDoNotDisturb(true);
        QVERIFY(f.adaptor->DoNotDisturb());
        QVERIFY(f.engine.isDoNotDisturb());

        f.adaptor->SetDoNotDisturb(true);
        f.adaptor->ToggleDoNotDisturb();
        QVERIFY(!f.adaptor->DoNotDisturb());

        QCOMPARE(changedSpy.count(), 2);
        QCOMPARE(changedSpy.at(0).at(0).toBool(), true);
        QCOMPARE(changedSpy.at(1).at(0).toBool(), false);
    }
};

QTEST_MAIN(TestControlAdaptor)
#include "test_control_adaptor.moc"
