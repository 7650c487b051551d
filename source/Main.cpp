// ============================================================================
// qrpaper - Main Entry Point
// ============================================================================

#include <QCoreApplication>
#include <QString>

#include "cli/CliParser.h"

// Test includes
#include "core/CodecTests.h"
#include "core/ReassemblerTests.h"
#include "layout/LayoutPolicyTests.h"
#include "qr/QrSymbolTests.h"
#include "pipeline/PaperPipelineTests.h"
#include "payload/PayloadTests.h"

#ifdef Q_OS_WIN
#include <windows.h>
#endif

// ============================================================================
// Test Runners
// ============================================================================

static int runTests(const QString& testType)
{
    bool success = false;

    if (testType == "codec") {
        success = CodecTests::runAllTests();
    } else if (testType == "reassembler") {
        success = ReassemblerTests::runAllTests();
    } else if (testType == "layout") {
        success = LayoutPolicyTests::runAllTests();
    } else if (testType == "qr") {
        success = QrSymbolTests::runAllTests();
    } else if (testType == "pipeline") {
        success = PaperPipelineTests::runAllTests();
    } else if (testType == "payload") {
        success = PayloadTests::runAllTests();
    }

    return success ? 0 : 1;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[])
{
#ifdef Q_OS_WIN
    // UTF-8 console output for the information page previews and JSON
    SetConsoleOutputCP(CP_UTF8);
#endif

    QCoreApplication app(argc, argv);
    app.setOrganizationName("QrPaper");
    app.setApplicationName("qrpaper");
    app.setApplicationVersion(QString::fromLatin1(Cli::appVersion()));

    // ========== Test Switches ==========
    QString testToRun;
    for (int i = 1; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg == "--test-codec") {
            testToRun = "codec";
        } else if (arg == "--test-reassembler") {
            testToRun = "reassembler";
        } else if (arg == "--test-layout") {
            testToRun = "layout";
        } else if (arg == "--test-qr") {
            testToRun = "qr";
        } else if (arg == "--test-pipeline") {
            testToRun = "pipeline";
        } else if (arg == "--test-payload") {
            testToRun = "payload";
        }
    }

    if (!testToRun.isEmpty()) {
        return runTests(testToRun);
    }

    // ========== CLI ==========
    return Cli::run(app, argc, argv);
}
