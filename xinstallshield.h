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
#ifndef XINSTALLSHIELD_H
#define XINSTALLSHIELD_H

#include "xpe.h"
#include "Algos/xinstallshielddecoder.h"

class XInstallShield : public XBinary {
    Q_OBJECT

public:
    enum FORMAT_VARIANT {
        FORMAT_VARIANT_UNKNOWN = 0,
        FORMAT_VARIANT_LEGACY,
        FORMAT_VARIANT_STREAM12,
        FORMAT_VARIANT_STREAM30,
        FORMAT_VARIANT_INSTALLSCRIPT
    };

    enum EXTRACT_STATUS {
        EXTRACT_STATUS_OK = 0,
        EXTRACT_STATUS_NOOVERLAY,
        EXTRACT_STATUS_UNSUPPORTEDFORMAT,
        EXTRACT_STATUS_TRUNCATEDHEADER,
        EXTRACT_STATUS_TRUNCATEDRECORD,
        EXTRACT_STATUS_CORRUPTPAYLOAD,
        EXTRACT_STATUS_RESYNCEXHAUSTED,
        EXTRACT_STATUS_MAXENTRIES,
        EXTRACT_STATUS_CANCELED
    };

    enum WALK_STATE {
        WALK_STATE_ATENTRYSTART = 0,
        WALK_STATE_RESYNCING,
        WALK_STATE_DONE
    };

    enum FILE_STATUS {
        FILE_STATUS_OK = 0,
        FILE_STATUS_TRUNCATED,
        FILE_STATUS_CORRUPTPAYLOAD,
        FILE_STATUS_UNDECODABLE
    };

    enum NOTE_KIND {
        NOTE_KIND_UNKNOWN = 0,
        NOTE_KIND_RESYNCHRONIZED,
        NOTE_KIND_ZEROLENGTH,
        NOTE_KIND_TRUNCATED,
        NOTE_KIND_CORRUPTPAYLOAD,
        NOTE_KIND_UNDECODABLE,
        NOTE_KIND_RESYNCEXHAUSTED,
        NOTE_KIND_MAXENTRIES,
        NOTE_KIND_TRAILINGDATA
    };

#pragma pack(push)
#pragma pack(1)
    struct IS_HEADER {
        char signature[13];  // "InstallShield" or "ISSetupStream"
        quint8 terminator;
        quint16 num_files;
        quint32 type;
        quint8 x4[8];
        quint8 x5[2];
        quint8 x6[16];
    };

    struct IS_FILE_ATTRIBUTES_12 {
        quint32 filename_len;
        quint32 encoded_flags;
        quint8 x3[2];
        quint32 file_len;
        quint8 x5[8];
        quint16 is_unicode_launcher;
    };

    struct IS_FILE_ATTRIBUTES_30 {
        quint32 filename_len;
        quint32 encoded_flags;
        quint16 x2;
        quint32 file_len;
        quint8 x5[8];
        quint16 is_unicode_launcher;
        quint8 file_time1[8];  // FILETIME
        quint8 file_time2[8];
        quint8 file_time3[8];
    };

    struct IS_FILE_ATTRIBUTES_LEGACY {
        char file_name[260];  // MAX_PATH
        quint32 encoded_flags;
        quint8 x3[4];
        quint32 file_len;
        quint8 x5[8];
        quint16 is_unicode_launcher;
        quint8 x7[30];
    };
#pragma pack(pop)

    static const quint32 N_FILENAME_MIN = 10;
    static const quint32 N_FILENAME_MAX = 200;
    static const quint16 N_X2_PREFERRED = 6;
    static const quint16 N_X2_MIN = 1;
    static const quint16 N_X2_MAX = 10;
    static const quint32 N_TYPE_DUPLICATE_ATTRIBUTES = 4;
    static const qint64 N_ZEROLENGTH_SCAN_LIMIT = 100 * 1024;
    static const quint32 N_FLAG_ENCODED = 0x2;
    static const quint32 N_FLAG_CHUNKED = 0x4;
    static const qint64 N_MAX_DECODED_SIZE = 0x10000000;

    struct OVERLAY_IMAGE {
        qint64 nOffset;  // Absolute offset in the PE file
        QByteArray baData;
    };

    struct OPTIONS {
        qint32 nMaxEntries;
        qint64 nMaxScanDistance;  // -1 = to the end of the image
        qint64 nZeroLengthScanLimit;
        bool bContinuePastDeclaredCount;
        QString sVersionHint;      // "30.0.157"
        qint32 nMajorVersionHint;  // -1 = take it from sVersionHint
        QString sInternalDescription;
        qint64 nMaxDecodedSize;  // Inflated size limit per file, 0 = no limit
        bool bVerbose;
    };

    struct HEADER {
        qint64 nOffset;  // Non zero if NB10 debug info precedes the header
        QString sSignature;
        quint8 nTerminator;
        quint16 nNumberOfFiles;
        quint32 nType;
        QByteArray baReserved1;
        QByteArray baReserved2;
        QByteArray baReserved3;
    };

    struct ATTRIBUTE_RECORD {
        FORMAT_VARIANT variant;
        quint32 nFileNameLength;
        quint32 nEncodedFlags;
        quint16 nX2;
        quint32 nFileLength;
        QByteArray baX5;
        quint16 nLauncherFlag;
        QByteArray baFileTime1;
        QByteArray baFileTime2;
        QByteArray baFileTime3;
    };

    struct ENTRY {
        FORMAT_VARIANT variant;
        qint64 nOffset;
        qint64 nSize;
        qint64 nDataOffset;
        qint64 nDataSize;
        ATTRIBUTE_RECORD record;
        QByteArray baFileNameRaw;  // Key material
        QString sFileName;
        bool bRecovered;
        bool bTruncated;
    };

    struct NOTE {
        NOTE_KIND kind;
        qint64 nOffset;
        qint64 nSize;
        QString sFileName;
    };

    struct WALK_RESULT {
        QList<ENTRY> listEntries;
        QList<NOTE> listNotes;
        qint64 nBytesLostToResync;
        qint64 nSteps;
        EXTRACT_STATUS termination;
    };

    struct DECODEDFILE {
        QString sFileName;
        QByteArray baContent;
        bool bRecovered;
        FILE_STATUS status;
    };

    struct EXTRACTION_REPORT {
        EXTRACT_STATUS status;
        EXTRACT_STATUS termination;
        FORMAT_VARIANT variant;
        HEADER header;
        QList<DECODEDFILE> listFiles;
        QList<NOTE> listNotes;
        qint32 nEntriesDecoded;
        qint64 nBytesLostToResync;
        qint32 nEntriesUndecodable;
    };

    explicit XInstallShield(QIODevice *pDevice = nullptr);
    ~XInstallShield() override;

    virtual bool isValid(PDSTRUCT *pPdStruct = nullptr) override;
    static bool isValid(QIODevice *pDevice);

    OVERLAY_IMAGE getOverlayImage(PDSTRUCT *pPdStruct = nullptr);
    QString getVersionHint();
    QString getInternalDescription();
    OPTIONS getOptions();

    EXTRACTION_REPORT extractFiles(const OPTIONS &options, PDSTRUCT *pPdStruct = nullptr);
    bool extractToDirectory(const QString &sDirectory, const OPTIONS &options, EXTRACTION_REPORT *pReport = nullptr, PDSTRUCT *pPdStruct = nullptr);

    static OPTIONS getDefaultOptions();

    static qint32 getMajorVersion(const QString &sVersionHint);
    static FORMAT_VARIANT getFormatVariant(const QString &sSignature, qint32 nMajorVersion);
    static FORMAT_VARIANT getFormatVariant(const QString &sSignature, const QString &sVersionHint);
    static bool isInstallScript(const QString &sInternalDescription);

    static qint64 getHeaderOffset(const QByteArray &baImage);
    static EXTRACT_STATUS readHeader(const QByteArray &baImage, HEADER *pHeader);

    static qint64 getAttributeRecordSize(FORMAT_VARIANT variant);
    static bool isAttributeRecordValid(const char *pData, qint64 nSize, FORMAT_VARIANT variant);
    static ATTRIBUTE_RECORD readAttributeRecord(const char *pData, qint64 nSize, FORMAT_VARIANT variant);

    static WALK_RESULT walk(const QByteArray &baImage, qint64 nOffset, const HEADER &header, FORMAT_VARIANT variant, const OPTIONS &options,
                            PDSTRUCT *pPdStruct = nullptr);
    static WALK_RESULT readInstallScriptTable(const QByteArray &baImage, const OPTIONS &options, PDSTRUCT *pPdStruct = nullptr);

    static DECODEDFILE decodeEntry(const QByteArray &baImage, const ENTRY &entry, const OPTIONS &options, PDSTRUCT *pPdStruct = nullptr);
    static EXTRACTION_REPORT extractFiles(const OVERLAY_IMAGE &overlayImage, const OPTIONS &options, PDSTRUCT *pPdStruct = nullptr);

    static QString getSafeFileName(const QString &sFileName, qint32 nIndex);

    static QString formatVariantToString(FORMAT_VARIANT variant);
    static QString extractStatusToString(EXTRACT_STATUS status);
    static QString fileStatusToString(FILE_STATUS status);
    static QString noteKindToString(NOTE_KIND kind);

private:
    static bool _isEntryStart(const char *pData, qint64 nSize, qint64 nOffset, quint32 nType, FORMAT_VARIANT variant);
    static qint64 _findEntryStart(const char *pData, qint64 nSize, qint64 nOffset, qint64 nLimit, quint32 nType, FORMAT_VARIANT variant,
                                  PDSTRUCT *pPdStruct);
    static bool _readEntry(const char *pData, qint64 nSize, qint64 nOffset, quint32 nType, FORMAT_VARIANT variant, ENTRY *pEntry);
    static QString _decodeUtf16(const char *pData, qint64 nSize);
    static bool _readUtf16String(const char *pData, qint64 nSize, qint64 *pnOffset, QString *psResult);
    static NOTE _createNote(NOTE_KIND kind, qint64 nOffset, qint64 nSize, const QString &sFileName = QString());
};

#endif  // XINSTALLSHIELD_H
