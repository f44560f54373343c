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
#include "xinstallshield.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSet>
#include <QtEndian>
#include <cstring>

const quint32 XInstallShield::N_FILENAME_MIN;
const quint32 XInstallShield::N_FILENAME_MAX;
const quint16 XInstallShield::N_X2_PREFERRED;
const quint16 XInstallShield::N_X2_MIN;
const quint16 XInstallShield::N_X2_MAX;
const quint32 XInstallShield::N_TYPE_DUPLICATE_ATTRIBUTES;
const qint64 XInstallShield::N_ZEROLENGTH_SCAN_LIMIT;
const quint32 XInstallShield::N_FLAG_ENCODED;
const quint32 XInstallShield::N_FLAG_CHUNKED;
const qint64 XInstallShield::N_MAX_DECODED_SIZE;

static const qint32 N_MAX_ENTRIES = 0x10000;
static const qint64 N_PROBE_SIZE = 0x1000;

XInstallShield::XInstallShield(QIODevice *pDevice) : XBinary(pDevice)
{
}

XInstallShield::~XInstallShield()
{
}

bool XInstallShield::isValid(PDSTRUCT *pPdStruct)
{
    Q_UNUSED(pPdStruct)

    bool bResult = false;

    XPE pe(getDevice());

    if (pe.isValid() && pe.isOverlayPresent()) {
        if (isInstallScript(getInternalDescription())) {
            bResult = true;
        } else {
            qint64 nOverlayOffset = pe.getOverlayOffset();
            qint64 nProbeSize = qMin(pe.getOverlaySize(), N_PROBE_SIZE);

            QByteArray baProbe = read_array(nOverlayOffset, nProbeSize);

            HEADER header = {};

            if (readHeader(baProbe, &header) == EXTRACT_STATUS_OK) {
                bResult = (getFormatVariant(header.sSignature, -1) != FORMAT_VARIANT_UNKNOWN);
            }
        }
    }

    return bResult;
}

bool XInstallShield::isValid(QIODevice *pDevice)
{
    XInstallShield xinstallshield(pDevice);

    return xinstallshield.isValid();
}

XInstallShield::OVERLAY_IMAGE XInstallShield::getOverlayImage(PDSTRUCT *pPdStruct)
{
    Q_UNUSED(pPdStruct)

    OVERLAY_IMAGE result = {};
    result.nOffset = -1;

    XPE pe(getDevice());

    if (pe.isValid() && pe.isOverlayPresent()) {
        result.nOffset = pe.getOverlayOffset();
        result.baData = read_array(result.nOffset, pe.getOverlaySize());
    }

    return result;
}

QString XInstallShield::getVersionHint()
{
    QString sResult;

    XPE pe(getDevice());

    if (pe.isValid()) {
        sResult = pe.getResourcesVersionValue("ProductVersion");

        if (sResult.isEmpty()) {
            sResult = pe.getFileVersion();
        }
    }

    return sResult;
}

QString XInstallShield::getInternalDescription()
{
    QString sResult;

    XPE pe(getDevice());

    if (pe.isValid()) {
        sResult = pe.getResourcesVersionValue("ISInternalDescription");
    }

    return sResult;
}

XInstallShield::OPTIONS XInstallShield::getOptions()
{
    OPTIONS result = getDefaultOptions();

    result.sVersionHint = getVersionHint();
    result.sInternalDescription = getInternalDescription();

    return result;
}

XInstallShield::EXTRACTION_REPORT XInstallShield::extractFiles(const OPTIONS &options, PDSTRUCT *pPdStruct)
{
    EXTRACTION_REPORT result = {};

    OVERLAY_IMAGE overlayImage = getOverlayImage(pPdStruct);

    if (overlayImage.baData.isEmpty()) {
        result.status = EXTRACT_STATUS_NOOVERLAY;
        result.termination = EXTRACT_STATUS_NOOVERLAY;
    } else {
        result = extractFiles(overlayImage, options, pPdStruct);
    }

    return result;
}

bool XInstallShield::extractToDirectory(const QString &sDirectory, const OPTIONS &options, EXTRACTION_REPORT *pReport, PDSTRUCT *pPdStruct)
{
    XBinary::PDSTRUCT pdStructEmpty = XBinary::createPdStruct();

    if (!pPdStruct) {
        pPdStruct = &pdStructEmpty;
    }

    bool bResult = false;

    EXTRACTION_REPORT report = extractFiles(options, pPdStruct);

    if (report.status == EXTRACT_STATUS_OK) {
        bResult = QDir().mkpath(sDirectory);

        QSet<QString> stFileNames;

        qint32 nNumberOfFiles = report.listFiles.count();

        for (qint32 i = 0; (i < nNumberOfFiles) && bResult && isPdStructNotCanceled(pPdStruct); i++) {
            const DECODEDFILE &decodedFile = report.listFiles.at(i);

            QString sFileName = getSafeFileName(decodedFile.sFileName, i);
            QString sUniqueName = sFileName;

            for (qint32 j = 1; stFileNames.contains(sUniqueName.toLower()); j++) {
                sUniqueName = QString("%1_%2").arg(sFileName, QString::number(j));
            }

            stFileNames.insert(sUniqueName.toLower());

            QString sResultFileName = sDirectory + QDir::separator() + sUniqueName;

            QFileInfo fi(sResultFileName);
            QDir().mkpath(fi.absolutePath());

            QFile file;
            file.setFileName(sResultFileName);

            if (file.open(QIODevice::WriteOnly)) {
                if (file.write(decodedFile.baContent) != decodedFile.baContent.size()) {
                    bResult = false;
                }

                file.close();
            } else {
                bResult = false;
            }
        }
    }

    if (pReport) {
        *pReport = report;
    }

    return bResult;
}

XInstallShield::OPTIONS XInstallShield::getDefaultOptions()
{
    OPTIONS result = {};

    result.nMaxEntries = N_MAX_ENTRIES;
    result.nMaxScanDistance = -1;
    result.nZeroLengthScanLimit = N_ZEROLENGTH_SCAN_LIMIT;
    result.bContinuePastDeclaredCount = false;
    result.nMajorVersionHint = -1;
    result.nMaxDecodedSize = N_MAX_DECODED_SIZE;
    result.bVerbose = false;

    return result;
}

qint32 XInstallShield::getMajorVersion(const QString &sVersionHint)
{
    qint32 nResult = -1;

    QString sHint = sVersionHint.trimmed();

    qint32 nLength = 0;

    while ((nLength < sHint.size()) && (sHint.at(nLength) >= QChar('0')) && (sHint.at(nLength) <= QChar('9'))) {
        nLength++;
    }

    if ((nLength > 0) && (nLength < 10)) {
        nResult = sHint.left(nLength).toInt();
    }

    return nResult;
}

XInstallShield::FORMAT_VARIANT XInstallShield::getFormatVariant(const QString &sSignature, qint32 nMajorVersion)
{
    FORMAT_VARIANT result = FORMAT_VARIANT_UNKNOWN;

    if (sSignature == "InstallShield") {
        result = FORMAT_VARIANT_LEGACY;
    } else if (sSignature == "ISSetupStream") {
        if (nMajorVersion >= 30) {
            result = FORMAT_VARIANT_STREAM30;
        } else {
            result = FORMAT_VARIANT_STREAM12;
        }
    }

    return result;
}

XInstallShield::FORMAT_VARIANT XInstallShield::getFormatVariant(const QString &sSignature, const QString &sVersionHint)
{
    return getFormatVariant(sSignature, getMajorVersion(sVersionHint));
}

bool XInstallShield::isInstallScript(const QString &sInternalDescription)
{
    return sInternalDescription.startsWith("InstallScript");
}

qint64 XInstallShield::getHeaderOffset(const QByteArray &baImage)
{
    qint64 nResult = 0;

    qint64 nSize = baImage.size();
    const char *pData = baImage.constData();

    if ((nSize >= 4) && (memcmp(pData, "NB10", 4) == 0)) {
        // PDB 2.0 info: signature, offset, timestamp, age and a zero terminated path
        nResult = -1;

        for (qint64 i = 16; i < nSize; i++) {
            if (pData[i] == 0) {
                nResult = i + 1;
                break;
            }
        }
    }

    return nResult;
}

XInstallShield::EXTRACT_STATUS XInstallShield::readHeader(const QByteArray &baImage, HEADER *pHeader)
{
    EXTRACT_STATUS result = EXTRACT_STATUS_TRUNCATEDHEADER;

    qint64 nOffset = getHeaderOffset(baImage);

    if ((nOffset != -1) && ((baImage.size() - nOffset) >= (qint64)sizeof(IS_HEADER))) {
        const char *pData = baImage.constData() + nOffset;

        *pHeader = HEADER();

        pHeader->nOffset = nOffset;
        pHeader->sSignature = QString::fromLatin1(pData + offsetof(IS_HEADER, signature), qstrnlen(pData, sizeof(IS_HEADER::signature)));
        pHeader->nTerminator = (quint8)pData[offsetof(IS_HEADER, terminator)];
        pHeader->nNumberOfFiles = qFromLittleEndian<quint16>(pData + offsetof(IS_HEADER, num_files));
        pHeader->nType = qFromLittleEndian<quint32>(pData + offsetof(IS_HEADER, type));
        pHeader->baReserved1 = QByteArray(pData + offsetof(IS_HEADER, x4), sizeof(IS_HEADER::x4));
        pHeader->baReserved2 = QByteArray(pData + offsetof(IS_HEADER, x5), sizeof(IS_HEADER::x5));
        pHeader->baReserved3 = QByteArray(pData + offsetof(IS_HEADER, x6), sizeof(IS_HEADER::x6));

        result = EXTRACT_STATUS_OK;
    }

    return result;
}

qint64 XInstallShield::getAttributeRecordSize(FORMAT_VARIANT variant)
{
    qint64 nResult = 0;

    if (variant == FORMAT_VARIANT_LEGACY) {
        nResult = sizeof(IS_FILE_ATTRIBUTES_LEGACY);
    } else if (variant == FORMAT_VARIANT_STREAM12) {
        nResult = sizeof(IS_FILE_ATTRIBUTES_12);
    } else if (variant == FORMAT_VARIANT_STREAM30) {
        nResult = sizeof(IS_FILE_ATTRIBUTES_30);
    }

    return nResult;
}

bool XInstallShield::isAttributeRecordValid(const char *pData, qint64 nSize, FORMAT_VARIANT variant)
{
    bool bResult = false;

    qint64 nRecordSize = getAttributeRecordSize(variant);

    if (pData && (nRecordSize > 0) && (nSize >= nRecordSize)) {
        if ((variant == FORMAT_VARIANT_STREAM12) || (variant == FORMAT_VARIANT_STREAM30)) {
            quint32 nFileNameLength = qFromLittleEndian<quint32>(pData + offsetof(IS_FILE_ATTRIBUTES_12, filename_len));
            quint32 nEncodedFlags = qFromLittleEndian<quint32>(pData + offsetof(IS_FILE_ATTRIBUTES_12, encoded_flags));

            quint8 nFlags = 0;

            if (variant == FORMAT_VARIANT_STREAM30) {
                nFlags = (quint8)(nEncodedFlags >> 8);
            } else {
                nFlags = (quint8)(nEncodedFlags);
            }

            bResult = ((nFileNameLength % 2) == 0) && (nFileNameLength >= N_FILENAME_MIN) && (nFileNameLength <= N_FILENAME_MAX) && (nFlags != 0x00) &&
                      (nFlags != 0xFF);

            if (bResult && (variant == FORMAT_VARIANT_STREAM30)) {
                quint16 nX2 = qFromLittleEndian<quint16>(pData + offsetof(IS_FILE_ATTRIBUTES_30, x2));

                // 6 is what the 30.x builds write, the rest of the range is tolerated
                bResult = (nX2 == N_X2_PREFERRED) || ((nX2 >= N_X2_MIN) && (nX2 <= N_X2_MAX));
            }
        } else if (variant == FORMAT_VARIANT_LEGACY) {
            for (qint32 i = 0; i < (qint32)sizeof(IS_FILE_ATTRIBUTES_LEGACY::file_name); i++) {
                quint8 nChar = (quint8)pData[i];

                if (nChar == 0) {
                    bResult = (i > 0);
                    break;
                }

                if ((nChar < 0x20) || (nChar == 0x7F)) {
                    break;
                }
            }
        }
    }

    return bResult;
}

XInstallShield::ATTRIBUTE_RECORD XInstallShield::readAttributeRecord(const char *pData, qint64 nSize, FORMAT_VARIANT variant)
{
    ATTRIBUTE_RECORD result = {};

    qint64 nRecordSize = getAttributeRecordSize(variant);

    if (pData && (nRecordSize > 0) && (nSize >= nRecordSize)) {
        result.variant = variant;

        if (variant == FORMAT_VARIANT_LEGACY) {
            result.nFileNameLength = qstrnlen(pData, sizeof(IS_FILE_ATTRIBUTES_LEGACY::file_name));
            result.nEncodedFlags = qFromLittleEndian<quint32>(pData + offsetof(IS_FILE_ATTRIBUTES_LEGACY, encoded_flags));
            result.nFileLength = qFromLittleEndian<quint32>(pData + offsetof(IS_FILE_ATTRIBUTES_LEGACY, file_len));
            result.baX5 = QByteArray(pData + offsetof(IS_FILE_ATTRIBUTES_LEGACY, x5), sizeof(IS_FILE_ATTRIBUTES_LEGACY::x5));
            result.nLauncherFlag = qFromLittleEndian<quint16>(pData + offsetof(IS_FILE_ATTRIBUTES_LEGACY, is_unicode_launcher));
        } else {
            result.nFileNameLength = qFromLittleEndian<quint32>(pData + offsetof(IS_FILE_ATTRIBUTES_12, filename_len));
            result.nEncodedFlags = qFromLittleEndian<quint32>(pData + offsetof(IS_FILE_ATTRIBUTES_12, encoded_flags));
            result.nX2 = qFromLittleEndian<quint16>(pData + offsetof(IS_FILE_ATTRIBUTES_12, x3));
            result.nFileLength = qFromLittleEndian<quint32>(pData + offsetof(IS_FILE_ATTRIBUTES_12, file_len));
            result.baX5 = QByteArray(pData + offsetof(IS_FILE_ATTRIBUTES_12, x5), sizeof(IS_FILE_ATTRIBUTES_12::x5));
            result.nLauncherFlag = qFromLittleEndian<quint16>(pData + offsetof(IS_FILE_ATTRIBUTES_12, is_unicode_launcher));

            if (variant == FORMAT_VARIANT_STREAM30) {
                result.baFileTime1 = QByteArray(pData + offsetof(IS_FILE_ATTRIBUTES_30, file_time1), sizeof(IS_FILE_ATTRIBUTES_30::file_time1));
                result.baFileTime2 = QByteArray(pData + offsetof(IS_FILE_ATTRIBUTES_30, file_time2), sizeof(IS_FILE_ATTRIBUTES_30::file_time2));
                result.baFileTime3 = QByteArray(pData + offsetof(IS_FILE_ATTRIBUTES_30, file_time3), sizeof(IS_FILE_ATTRIBUTES_30::file_time3));
            }
        }
    }

    return result;
}

bool XInstallShield::_isEntryStart(const char *pData, qint64 nSize, qint64 nOffset, quint32 nType, FORMAT_VARIANT variant)
{
    bool bResult = false;

    qint64 nRecordOffset = nOffset;
    bool bDuplicate = (variant == FORMAT_VARIANT_STREAM30) && (nType == N_TYPE_DUPLICATE_ATTRIBUTES);

    if (bDuplicate) {
        nRecordOffset += sizeof(IS_FILE_ATTRIBUTES_30);
    }

    if ((nOffset >= 0) && (nRecordOffset < nSize)) {
        bool bValid = isAttributeRecordValid(pData + nRecordOffset, nSize - nRecordOffset, variant);

        if (bValid && bDuplicate) {
            // The leading copy has to be a record for the same file
            bValid = isAttributeRecordValid(pData + nOffset, nSize - nOffset, variant) &&
                     (memcmp(pData + nOffset, pData + nRecordOffset, offsetof(IS_FILE_ATTRIBUTES_30, x5)) == 0);
        }

        if (bValid) {
            if (variant == FORMAT_VARIANT_LEGACY) {
                bResult = true;
            } else {
                // The name has to be inside the image
                quint32 nFileNameLength = qFromLittleEndian<quint32>(pData + nRecordOffset);

                bResult = ((nRecordOffset + getAttributeRecordSize(variant) + nFileNameLength) <= nSize);
            }
        }
    }

    return bResult;
}

qint64 XInstallShield::_findEntryStart(const char *pData, qint64 nSize, qint64 nOffset, qint64 nLimit, quint32 nType, FORMAT_VARIANT variant,
                                       PDSTRUCT *pPdStruct)
{
    qint64 nResult = -1;

    qint64 nEnd = qMin(nLimit, nSize);

    for (qint64 i = nOffset; (i < nEnd) && isPdStructNotCanceled(pPdStruct); i++) {
        if (_isEntryStart(pData, nSize, i, nType, variant)) {
            nResult = i;
            break;
        }
    }

    return nResult;
}

QString XInstallShield::_decodeUtf16(const char *pData, qint64 nSize)
{
    QString sResult;

    qint64 nNumberOfChars = nSize / 2;

    for (qint64 i = 0; i < nNumberOfChars; i++) {
        sResult.append(QChar(qFromLittleEndian<quint16>(pData + i * 2)));
    }

    while (sResult.startsWith(QChar(0))) {
        sResult.remove(0, 1);
    }

    while (sResult.endsWith(QChar(0))) {
        sResult.chop(1);
    }

    return sResult;
}

bool XInstallShield::_readEntry(const char *pData, qint64 nSize, qint64 nOffset, quint32 nType, FORMAT_VARIANT variant, ENTRY *pEntry)
{
    bool bResult = false;

    if (_isEntryStart(pData, nSize, nOffset, nType, variant)) {
        qint64 nRecordOffset = nOffset;

        if ((variant == FORMAT_VARIANT_STREAM30) && (nType == N_TYPE_DUPLICATE_ATTRIBUTES)) {
            nRecordOffset += sizeof(IS_FILE_ATTRIBUTES_30);
        }

        qint64 nRecordSize = getAttributeRecordSize(variant);

        pEntry->variant = variant;
        pEntry->nOffset = nOffset;
        pEntry->record = readAttributeRecord(pData + nRecordOffset, nSize - nRecordOffset, variant);

        if (variant == FORMAT_VARIANT_LEGACY) {
            pEntry->baFileNameRaw = QByteArray(pData + nRecordOffset, pEntry->record.nFileNameLength);
            pEntry->sFileName = QString::fromLatin1(pEntry->baFileNameRaw);
            pEntry->nDataOffset = nRecordOffset + nRecordSize;
        } else {
            const char *pFileName = pData + nRecordOffset + nRecordSize;
            qint64 nFileNameSize = pEntry->record.nFileNameLength;

            // Terminating zero code units are not key material
            while ((nFileNameSize >= 2) && (pFileName[nFileNameSize - 1] == 0) && (pFileName[nFileNameSize - 2] == 0)) {
                nFileNameSize -= 2;
            }

            pEntry->baFileNameRaw = QByteArray(pFileName, nFileNameSize);
            pEntry->sFileName = _decodeUtf16(pFileName, nFileNameSize);
            pEntry->nDataOffset = nRecordOffset + nRecordSize + pEntry->record.nFileNameLength;
        }

        pEntry->nDataSize = pEntry->record.nFileLength;
        pEntry->nSize = (pEntry->nDataOffset + pEntry->nDataSize) - nOffset;

        bResult = true;
    }

    return bResult;
}

XInstallShield::NOTE XInstallShield::_createNote(NOTE_KIND kind, qint64 nOffset, qint64 nSize, const QString &sFileName)
{
    NOTE result = {};

    result.kind = kind;
    result.nOffset = nOffset;
    result.nSize = nSize;
    result.sFileName = sFileName;

    return result;
}

XInstallShield::WALK_RESULT XInstallShield::walk(const QByteArray &baImage, qint64 nOffset, const HEADER &header, FORMAT_VARIANT variant, const OPTIONS &options,
                                                 PDSTRUCT *pPdStruct)
{
    XBinary::PDSTRUCT pdStructEmpty = XBinary::createPdStruct();

    if (!pPdStruct) {
        pPdStruct = &pdStructEmpty;
    }

    WALK_RESULT result = {};
    result.termination = EXTRACT_STATUS_OK;

    const char *pData = baImage.constData();
    qint64 nSize = baImage.size();

    qint64 nMaxEntries = (options.nMaxEntries > 0) ? options.nMaxEntries : nSize;
    qint64 nMaxScanDistance = (options.nMaxScanDistance > 0) ? options.nMaxScanDistance : nSize;
    qint64 nZeroLengthScanLimit = (options.nZeroLengthScanLimit > 0) ? options.nZeroLengthScanLimit : N_ZEROLENGTH_SCAN_LIMIT;

    qint64 nCursor = qMax(nOffset, (qint64)0);
    bool bResynchronized = false;
    bool bCountReached = false;

    WALK_STATE state = WALK_STATE_ATENTRYSTART;

    if (getAttributeRecordSize(variant) == 0) {
        result.termination = EXTRACT_STATUS_UNSUPPORTEDFORMAT;
        state = WALK_STATE_DONE;
    }

    while (state != WALK_STATE_DONE) {
        if (!isPdStructNotCanceled(pPdStruct)) {
            result.termination = EXTRACT_STATUS_CANCELED;
            state = WALK_STATE_DONE;
            break;
        }

        if (nCursor >= nSize) {
            state = WALK_STATE_DONE;
            break;
        }

        result.nSteps++;

        if (state == WALK_STATE_ATENTRYSTART) {
            if (result.listEntries.count() >= nMaxEntries) {
                result.listNotes.append(_createNote(NOTE_KIND_MAXENTRIES, nCursor, nSize - nCursor));
                result.termination = EXTRACT_STATUS_MAXENTRIES;
                state = WALK_STATE_DONE;
                break;
            }

            ENTRY entry = {};

            if (_readEntry(pData, nSize, nCursor, header.nType, variant, &entry)) {
                bool bClean = !bResynchronized;

                entry.bRecovered = bResynchronized;
                bResynchronized = false;

                if ((variant != FORMAT_VARIANT_LEGACY) && (entry.nDataSize == 0)) {
                    // Content runs up to the next record
                    qint64 nLimit = qMin(entry.nDataOffset + nZeroLengthScanLimit, nSize);
                    qint64 nNext = _findEntryStart(pData, nSize, entry.nDataOffset, nLimit, header.nType, variant, pPdStruct);
                    qint64 nRecovered = (nNext != -1) ? (nNext - entry.nDataOffset) : (nLimit - entry.nDataOffset);

                    if (nRecovered > 0) {
                        entry.nDataSize = nRecovered;
                        entry.nSize += nRecovered;
                        entry.bRecovered = true;

                        result.listNotes.append(_createNote(NOTE_KIND_ZEROLENGTH, entry.nDataOffset, nRecovered, entry.sFileName));

                        if (options.bVerbose) {
                            qDebug() << "Zero length entry" << entry.sFileName << "recovered" << nRecovered << "bytes";
                        }
                    }
                }

                if ((entry.nDataOffset + entry.nDataSize) > nSize) {
                    entry.nDataSize = nSize - entry.nDataOffset;
                    entry.nSize = nSize - entry.nOffset;
                    entry.bTruncated = true;

                    result.listNotes.append(_createNote(NOTE_KIND_TRUNCATED, entry.nOffset, entry.nSize, entry.sFileName));
                    result.termination = EXTRACT_STATUS_TRUNCATEDRECORD;
                    state = WALK_STATE_DONE;

                    if (options.bVerbose) {
                        qWarning() << "Entry" << entry.sFileName << "runs past the end of the overlay";
                    }
                }

                result.listEntries.append(entry);
                nCursor = entry.nOffset + entry.nSize;

                // The declared count only counts once it is met by a record read in place
                if ((state != WALK_STATE_DONE) && bClean && (header.nNumberOfFiles > 0) && (result.listEntries.count() >= header.nNumberOfFiles)) {
                    bCountReached = true;

                    if (!options.bContinuePastDeclaredCount) {
                        if (nCursor < nSize) {
                            result.listNotes.append(_createNote(NOTE_KIND_TRAILINGDATA, nCursor, nSize - nCursor));
                        }

                        state = WALK_STATE_DONE;
                    }
                }
            } else if (bCountReached) {
                // Past the declared count only clean records are taken
                result.listNotes.append(_createNote(NOTE_KIND_TRAILINGDATA, nCursor, nSize - nCursor));
                state = WALK_STATE_DONE;
            } else {
                state = WALK_STATE_RESYNCING;
            }
        } else if (state == WALK_STATE_RESYNCING) {
            // Candidates are nCursor + 1 .. nCursor + nMaxScanDistance
            qint64 nLimit = (nMaxScanDistance >= (nSize - nCursor)) ? nSize : (nCursor + nMaxScanDistance + 1);
            qint64 nFound = _findEntryStart(pData, nSize, nCursor + 1, nLimit, header.nType, variant, pPdStruct);

            if (nFound != -1) {
                qint64 nLost = nFound - nCursor;

                result.listNotes.append(_createNote(NOTE_KIND_RESYNCHRONIZED, nCursor, nLost));
                result.nBytesLostToResync += nLost;

                if (options.bVerbose) {
                    qDebug() << "Resynchronized at" << nFound << "skipped" << nLost << "bytes";
                }

                nCursor = nFound;
                bResynchronized = true;
                state = WALK_STATE_ATENTRYSTART;
            } else if (!isPdStructNotCanceled(pPdStruct)) {
                result.termination = EXTRACT_STATUS_CANCELED;
                state = WALK_STATE_DONE;
            } else {
                qint64 nLost = qMin(nMaxScanDistance, nSize - nCursor);

                result.listNotes.append(_createNote(NOTE_KIND_RESYNCEXHAUSTED, nCursor, nLost));
                result.nBytesLostToResync += nLost;
                result.termination = EXTRACT_STATUS_RESYNCEXHAUSTED;
                state = WALK_STATE_DONE;

                if (options.bVerbose) {
                    qWarning() << "No valid record after offset" << nCursor;
                }
            }
        }
    }

    return result;
}

bool XInstallShield::_readUtf16String(const char *pData, qint64 nSize, qint64 *pnOffset, QString *psResult)
{
    bool bResult = false;

    QString sResult;
    qint64 nOffset = *pnOffset;

    while ((nOffset + 2) <= nSize) {
        quint16 nChar = qFromLittleEndian<quint16>(pData + nOffset);
        nOffset += 2;

        if (nChar == 0) {
            bResult = true;
            break;
        }

        sResult.append(QChar(nChar));
    }

    if (bResult) {
        *pnOffset = nOffset;
        *psResult = sResult;
    }

    return bResult;
}

XInstallShield::WALK_RESULT XInstallShield::readInstallScriptTable(const QByteArray &baImage, const OPTIONS &options, PDSTRUCT *pPdStruct)
{
    XBinary::PDSTRUCT pdStructEmpty = XBinary::createPdStruct();

    if (!pPdStruct) {
        pPdStruct = &pdStructEmpty;
    }

    WALK_RESULT result = {};
    result.termination = EXTRACT_STATUS_OK;

    const char *pData = baImage.constData();
    qint64 nSize = baImage.size();

    if (nSize < 4) {
        result.termination = EXTRACT_STATUS_TRUNCATEDHEADER;
        return result;
    }

    qint64 nMaxEntries = (options.nMaxEntries > 0) ? options.nMaxEntries : nSize;
    quint32 nNumberOfFiles = qFromLittleEndian<quint32>(pData);
    qint64 nOffset = 4;

    for (quint32 i = 0; (i < nNumberOfFiles) && isPdStructNotCanceled(pPdStruct); i++) {
        result.nSteps++;

        if (result.listEntries.count() >= nMaxEntries) {
            result.listNotes.append(_createNote(NOTE_KIND_MAXENTRIES, nOffset, nSize - nOffset));
            result.termination = EXTRACT_STATUS_MAXENTRIES;
            break;
        }

        qint64 nEntryOffset = nOffset;

        QString sFileName;
        QString sUnused;
        QString sFileSize;

        // Name, two strings nobody reads and the size as decimal text
        bool bFields = _readUtf16String(pData, nSize, &nOffset, &sFileName) && _readUtf16String(pData, nSize, &nOffset, &sUnused) &&
                       _readUtf16String(pData, nSize, &nOffset, &sUnused) && _readUtf16String(pData, nSize, &nOffset, &sFileSize);

        if (!bFields) {
            result.listNotes.append(_createNote(NOTE_KIND_TRUNCATED, nEntryOffset, nSize - nEntryOffset));
            result.termination = EXTRACT_STATUS_TRUNCATEDRECORD;
            break;
        }

        ENTRY entry = {};
        entry.variant = FORMAT_VARIANT_INSTALLSCRIPT;
        entry.nOffset = nEntryOffset;
        entry.nDataOffset = nOffset;
        entry.nDataSize = sFileSize.trimmed().toUInt();
        entry.sFileName = sFileName;
        entry.baFileNameRaw = sFileName.toUtf8();
        entry.record.variant = FORMAT_VARIANT_INSTALLSCRIPT;
        entry.record.nFileNameLength = sFileName.size() * 2;
        entry.record.nFileLength = (quint32)entry.nDataSize;

        if ((entry.nDataOffset + entry.nDataSize) > nSize) {
            entry.nDataSize = nSize - entry.nDataOffset;
            entry.bTruncated = true;

            result.listNotes.append(_createNote(NOTE_KIND_TRUNCATED, entry.nOffset, nSize - entry.nOffset, entry.sFileName));
            result.termination = EXTRACT_STATUS_TRUNCATEDRECORD;
        }

        entry.nSize = (entry.nDataOffset + entry.nDataSize) - entry.nOffset;

        result.listEntries.append(entry);
        nOffset = entry.nDataOffset + entry.nDataSize;

        if (entry.bTruncated) {
            break;
        }
    }

    if (!isPdStructNotCanceled(pPdStruct)) {
        result.termination = EXTRACT_STATUS_CANCELED;
    }

    return result;
}

XInstallShield::DECODEDFILE XInstallShield::decodeEntry(const QByteArray &baImage, const ENTRY &entry, const OPTIONS &options, PDSTRUCT *pPdStruct)
{
    DECODEDFILE result = {};

    result.sFileName = entry.sFileName;
    result.bRecovered = entry.bRecovered;

    QByteArray baData = baImage.mid(entry.nDataOffset, entry.nDataSize);

    if ((entry.variant == FORMAT_VARIANT_INSTALLSCRIPT) || ((entry.record.nEncodedFlags & (N_FLAG_ENCODED | N_FLAG_CHUNKED)) == 0)) {
        // Stored as is
        result.baContent = baData;
        result.status = FILE_STATUS_OK;
    } else {
        XInstallShieldDecoder::DECODE_RESULT decodeResult =
            XInstallShieldDecoder::decode(baData, entry.baFileNameRaw, &result.baContent, options.nMaxDecodedSize, pPdStruct);

        if (decodeResult == XInstallShieldDecoder::DECODE_RESULT_CORRUPTPAYLOAD) {
            result.status = FILE_STATUS_CORRUPTPAYLOAD;
        } else if (decodeResult == XInstallShieldDecoder::DECODE_RESULT_UNDECODABLE) {
            result.status = FILE_STATUS_UNDECODABLE;
        } else {
            result.status = FILE_STATUS_OK;
        }
    }

    if (entry.bTruncated && (result.status == FILE_STATUS_OK)) {
        result.status = FILE_STATUS_TRUNCATED;
    }

    return result;
}

XInstallShield::EXTRACTION_REPORT XInstallShield::extractFiles(const OVERLAY_IMAGE &overlayImage, const OPTIONS &options, PDSTRUCT *pPdStruct)
{
    XBinary::PDSTRUCT pdStructEmpty = XBinary::createPdStruct();

    if (!pPdStruct) {
        pPdStruct = &pdStructEmpty;
    }

    EXTRACTION_REPORT result = {};
    result.status = EXTRACT_STATUS_OK;
    result.termination = EXTRACT_STATUS_OK;

    const QByteArray &baImage = overlayImage.baData;

    WALK_RESULT walkResult = {};

    if (baImage.isEmpty()) {
        result.status = EXTRACT_STATUS_NOOVERLAY;
    } else if (isInstallScript(options.sInternalDescription)) {
        result.variant = FORMAT_VARIANT_INSTALLSCRIPT;

        walkResult = readInstallScriptTable(baImage, options, pPdStruct);

        if (walkResult.termination == EXTRACT_STATUS_TRUNCATEDHEADER) {
            result.status = EXTRACT_STATUS_TRUNCATEDHEADER;
        }
    } else {
        result.status = readHeader(baImage, &result.header);

        if (result.status == EXTRACT_STATUS_OK) {
            qint32 nMajorVersion = options.nMajorVersionHint;

            if (nMajorVersion == -1) {
                nMajorVersion = getMajorVersion(options.sVersionHint);
            }

            result.variant = getFormatVariant(result.header.sSignature, nMajorVersion);

            if (options.bVerbose) {
                qDebug() << "Signature" << result.header.sSignature << "files" << result.header.nNumberOfFiles << "type" << result.header.nType << "variant"
                         << formatVariantToString(result.variant);
            }

            if (result.variant == FORMAT_VARIANT_UNKNOWN) {
                result.status = EXTRACT_STATUS_UNSUPPORTEDFORMAT;
            } else {
                walkResult = walk(baImage, result.header.nOffset + (qint64)sizeof(IS_HEADER), result.header, result.variant, options, pPdStruct);
            }
        }
    }

    if (result.status == EXTRACT_STATUS_OK) {
        result.termination = walkResult.termination;
        result.listNotes = walkResult.listNotes;
        result.nBytesLostToResync = walkResult.nBytesLostToResync;

        qint32 nNumberOfEntries = walkResult.listEntries.count();

        for (qint32 i = 0; (i < nNumberOfEntries) && isPdStructNotCanceled(pPdStruct); i++) {
            const ENTRY &entry = walkResult.listEntries.at(i);

            DECODEDFILE decodedFile = decodeEntry(baImage, entry, options, pPdStruct);

            if ((decodedFile.status == FILE_STATUS_OK) || (decodedFile.status == FILE_STATUS_TRUNCATED)) {
                result.nEntriesDecoded++;
            } else {
                result.nEntriesUndecodable++;

                NOTE_KIND kind = (decodedFile.status == FILE_STATUS_CORRUPTPAYLOAD) ? NOTE_KIND_CORRUPTPAYLOAD : NOTE_KIND_UNDECODABLE;
                result.listNotes.append(_createNote(kind, entry.nDataOffset, entry.nDataSize, entry.sFileName));

                if (options.bVerbose) {
                    qWarning() << "Cannot decode" << entry.sFileName << fileStatusToString(decodedFile.status);
                }
            }

            result.listFiles.append(decodedFile);
        }
    }

    return result;
}

QString XInstallShield::getSafeFileName(const QString &sFileName, qint32 nIndex)
{
    QString sResult;

    QString sName = sFileName;
    sName.replace(QChar('\\'), QChar('/'));
    sName.replace(QChar(':'), QChar('_'));

    QStringList listParts = sName.split(QChar('/'));
    QStringList listSafeParts;

    qint32 nNumberOfParts = listParts.count();

    for (qint32 i = 0; i < nNumberOfParts; i++) {
        QString sPart = listParts.at(i).trimmed();

        if ((sPart != "") && (sPart != ".") && (sPart != "..")) {
            listSafeParts.append(sPart);
        }
    }

    sResult = listSafeParts.join(QChar('/'));

    if (sResult.isEmpty()) {
        sResult = QString("file_%1").arg(nIndex, 4, 10, QChar('0'));
    }

    return sResult;
}

QString XInstallShield::formatVariantToString(FORMAT_VARIANT variant)
{
    QString sResult = tr("Unknown");

    switch (variant) {
        case FORMAT_VARIANT_LEGACY: sResult = QString("InstallShield"); break;
        case FORMAT_VARIANT_STREAM12: sResult = QString("ISSetupStream 12"); break;
        case FORMAT_VARIANT_STREAM30: sResult = QString("ISSetupStream 30"); break;
        case FORMAT_VARIANT_INSTALLSCRIPT: sResult = QString("InstallScript"); break;
        default: break;
    }

    return sResult;
}

QString XInstallShield::extractStatusToString(EXTRACT_STATUS status)
{
    QString sResult = tr("Unknown");

    switch (status) {
        case EXTRACT_STATUS_OK: sResult = tr("OK"); break;
        case EXTRACT_STATUS_NOOVERLAY: sResult = tr("No overlay"); break;
        case EXTRACT_STATUS_UNSUPPORTEDFORMAT: sResult = tr("Unsupported format"); break;
        case EXTRACT_STATUS_TRUNCATEDHEADER: sResult = tr("Truncated header"); break;
        case EXTRACT_STATUS_TRUNCATEDRECORD: sResult = tr("Truncated record"); break;
        case EXTRACT_STATUS_CORRUPTPAYLOAD: sResult = tr("Corrupt payload"); break;
        case EXTRACT_STATUS_RESYNCEXHAUSTED: sResult = tr("Resync exhausted"); break;
        case EXTRACT_STATUS_MAXENTRIES: sResult = tr("Too many entries"); break;
        case EXTRACT_STATUS_CANCELED: sResult = tr("Canceled"); break;
    }

    return sResult;
}

QString XInstallShield::fileStatusToString(FILE_STATUS status)
{
    QString sResult = tr("Unknown");

    switch (status) {
        case FILE_STATUS_OK: sResult = tr("OK"); break;
        case FILE_STATUS_TRUNCATED: sResult = tr("Truncated"); break;
        case FILE_STATUS_CORRUPTPAYLOAD: sResult = tr("Corrupt payload"); break;
        case FILE_STATUS_UNDECODABLE: sResult = tr("Undecodable"); break;
    }

    return sResult;
}

QString XInstallShield::noteKindToString(NOTE_KIND kind)
{
    QString sResult = tr("Unknown");

    switch (kind) {
        case NOTE_KIND_RESYNCHRONIZED: sResult = tr("Resynchronized"); break;
        case NOTE_KIND_ZEROLENGTH: sResult = tr("Zero length"); break;
        case NOTE_KIND_TRUNCATED: sResult = tr("Truncated"); break;
        case NOTE_KIND_CORRUPTPAYLOAD: sResult = tr("Corrupt payload"); break;
        case NOTE_KIND_UNDECODABLE: sResult = tr("Undecodable"); break;
        case NOTE_KIND_RESYNCEXHAUSTED: sResult = tr("Resync exhausted"); break;
        case NOTE_KIND_MAXENTRIES: sResult = tr("Too many entries"); break;
        case NOTE_KIND_TRAILINGDATA: sResult = tr("Trailing data"); break;
        default: break;
    }

    return sResult;
}
