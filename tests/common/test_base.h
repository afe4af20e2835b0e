#pragma once

#include <QElapsedTimer>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QTemporaryDir>
#include <QTest>
#include <memory>

// Defined once per test executable, next to QTEST_MAIN
Q_DECLARE_LOGGING_CATEGORY(jlcTests)

/**
 * Base class for all JLCut tests providing common setup and utilities
 * Gives every test case a scratch directory and slow-test reporting
 */
class TestBase : public QObject
{
    Q_OBJECT

protected:
    // Test data directory management
    std::unique_ptr<QTemporaryDir> m_testDataDir;

    // Test timing and performance validation
    QElapsedTimer m_timer;

public:
    TestBase(QObject *parent = nullptr) : QObject(parent) {}

protected slots:
    /**
     * Initialize test environment before the first test method
     * Creates an isolated temporary directory
     */
    virtual void initTestCase() {
        // Set up logging for tests
        QLoggingCategory::setFilterRules("jlc.tests=true\njlc.*.debug=false");
        qCInfo(jlcTests, "Initializing test case: %s", metaObject()->className());

        m_testDataDir = std::make_unique<QTemporaryDir>();
        QVERIFY(m_testDataDir->isValid());
    }

    virtual void cleanupTestCase() {
        qCInfo(jlcTests, "Cleaning up test case: %s", metaObject()->className());
        m_testDataDir.reset();
    }

    virtual void init() {
        m_timer.start();
    }

    virtual void cleanup() {
        auto elapsedMs = m_timer.elapsed();
        if (elapsedMs > 1000) { // Log slow tests
            qCWarning(jlcTests, "Slow test detected: %lldms", elapsedMs);
        }
    }

protected:
    /**
     * Verify performance requirements are met
     */
    void verifyPerformance(const QString& operation, int maxMs = 100) {
        auto elapsed = m_timer.elapsed();
        if (elapsed > maxMs) {
            QFAIL(qPrintable(QString("Performance requirement failed: %1 took %2ms (max: %3ms)")
                           .arg(operation).arg(elapsed).arg(maxMs)));
        }
        qCInfo(jlcTests, "%s completed in %lldms", operation.toUtf8().constData(), elapsed);
    }

    // Write `contents` under the scratch directory and return its path
    QString writeTestFile(const QString& relativePath, const QByteArray& contents) {
        const QString path = m_testDataDir->filePath(relativePath);
        QDir().mkpath(QFileInfo(path).absolutePath());
        QFile file(path);
        if (!file.open(QIODevice::WriteOnly)) {
            qCWarning(jlcTests, "Cannot write test file %s", qPrintable(path));
            return QString();
        }
        file.write(contents);
        return path;
    }
};
