/* Copyright (c) 2025 hors<horsicq@gmail.com>
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <cstdio>

#include "xinstallshield.h"

static void printReport(const XInstallShield::EXTRACTION_REPORT &report, bool bList)
{
    if (report.variant != XInstallShield::FORMAT_VARIANT_INSTALLSCRIPT) {
        printf("Signature: %s\n", qPrintable(report.header.sSignature));
        printf("Declared files: %d\n", report.header.nNumberOfFiles);
        printf("Type: %u\n", report.header.nType);
    }

    printf("Variant: %s\n", qPrintable(XInstallShield::formatVariantToString(report.variant)));

    if (bList) {
        qint32 nNumberOfFiles = report.listFiles.count();

        for (qint32 i = 0; i < nNumberOfFiles; i++) {
            const XInstallShield::DECODEDFILE &decodedFile = report.listFiles.at(i);

            printf("%10d  %-16s %s%s\n", decodedFile.baContent.size(), qPrintable(XInstallShield::fileStatusToString(decodedFile.status)),
                   qPrintable(decodedFile.sFileName), decodedFile.bRecovered ? " (recovered)" : "");
        }
    }

    qint32 nNumberOfNotes = report.listNotes.count();

    for (qint32 i = 0; i < nNumberOfNotes; i++) {
        const XInstallShield::NOTE &note = report.listNotes.at(i);

        printf("Note: %s at 0x%llX size 0x%llX %s\n", qPrintable(XInstallShield::noteKindToString(note.kind)), (unsigned long long)note.nOffset,
               (unsigned long long)note.nSize, qPrintable(note.sFileName));
    }

    printf("Decoded: %d\n", report.nEntriesDecoded);
    printf("Undecodable: %d\n", report.nEntriesUndecodable);
    printf("Bytes lost to resync: %lld\n", (long long)report.nBytesLostToResync);
    printf("Termination: %s\n", qPrintable(XInstallShield::extractStatusToString(report.termination)));
}

int main(int argc, char *argv[])
{
    QCoreApplication::setApplicationName("isxtract");
    QCoreApplication::setApplicationVersion("1.00");

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription("Extracts files from InstallShield setup executables");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("file", "The setup executable.");

    QCommandLineOption clOutput(QStringList() << "o" << "output", "Extract files to <directory>.", "directory");
    QCommandLineOption clList(QStringList() << "l" << "list", "List files.");
    QCommandLineOption clVersionHint(QStringList() << "version-hint", "Product version of the installer, e.g. 30.0.157.", "version");
    QCommandLineOption clInternalDescription(QStringList() << "internal-description", "Overrides the ISInternalDescription resource.", "text");
    QCommandLineOption clMaxEntries(QStringList() << "max-entries", "Stop after <count> entries.", "count");
    QCommandLineOption clScanLimit(QStringList() << "scan-limit", "Resynchronization distance in bytes.", "size");
    QCommandLineOption clZeroLengthCap(QStringList() << "zero-length-cap", "Scan limit for entries without a length.", "size");
    QCommandLineOption clMaxDecodedSize(QStringList() << "max-decoded-size", "Largest inflated file in bytes, 0 for no limit.", "size");
    QCommandLineOption clContinuePastCount(QStringList() << "continue-past-count", "Keep reading valid records after the declared count.");
    QCommandLineOption clVerbose(QStringList() << "v" << "verbose", "Show diagnostics.");

    parser.addOption(clOutput);
    parser.addOption(clList);
    parser.addOption(clVersionHint);
    parser.addOption(clInternalDescription);
    parser.addOption(clMaxEntries);
    parser.addOption(clScanLimit);
    parser.addOption(clZeroLengthCap);
    parser.addOption(clMaxDecodedSize);
    parser.addOption(clContinuePastCount);
    parser.addOption(clVerbose);

    parser.process(app);

    QStringList listArgs = parser.positionalArguments();

    if (listArgs.count() != 1) {
        parser.showHelp(1);
    }

    int nResult = 1;

    QString sFileName = listArgs.at(0);

    QFile file;
    file.setFileName(sFileName);

    if (file.open(QIODevice::ReadOnly)) {
        XInstallShield xinstallshield(&file);

        XInstallShield::OPTIONS options = xinstallshield.getOptions();

        if (parser.isSet(clVersionHint)) {
            options.sVersionHint = parser.value(clVersionHint);
        }

        if (parser.isSet(clInternalDescription)) {
            options.sInternalDescription = parser.value(clInternalDescription);
        }

        if (parser.isSet(clMaxEntries)) {
            options.nMaxEntries = parser.value(clMaxEntries).toInt();
        }

        if (parser.isSet(clScanLimit)) {
            options.nMaxScanDistance = parser.value(clScanLimit).toLongLong();
        }

        if (parser.isSet(clZeroLengthCap)) {
            options.nZeroLengthScanLimit = parser.value(clZeroLengthCap).toLongLong();
        }

        if (parser.isSet(clMaxDecodedSize)) {
            options.nMaxDecodedSize = parser.value(clMaxDecodedSize).toLongLong();
        }

        options.bContinuePastDeclaredCount = parser.isSet(clContinuePastCount);
        options.bVerbose = parser.isSet(clVerbose);

        XInstallShield::EXTRACTION_REPORT report = {};

        bool bSuccess = false;

        if (parser.isSet(clOutput)) {
            bSuccess = xinstallshield.extractToDirectory(parser.value(clOutput), options, &report);
        } else {
            report = xinstallshield.extractFiles(options);
            bSuccess = (report.status == XInstallShield::EXTRACT_STATUS_OK);
        }

        if (report.status == XInstallShield::EXTRACT_STATUS_OK) {
            printReport(report, parser.isSet(clList) || !parser.isSet(clOutput));
        } else {
            printf("%s: %s\n", qPrintable(sFileName), qPrintable(XInstallShield::extractStatusToString(report.status)));
        }

        if (bSuccess) {
            nResult = 0;
        }

        file.close();
    } else {
        printf("Cannot open file: %s\n", qPrintable(sFileName));
    }

    return nResult;
}
