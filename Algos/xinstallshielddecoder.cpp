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
#include "xinstallshielddecoder.h"

#include <zlib.h>

static const quint8 g_XOR_MAGIC[4] = {0x13, 0x35, 0x86, 0x07};
static const qint32 N_INFLATE_BUFFER_SIZE = 0x4000;

const qint32 XInstallShieldDecoder::N_BLOCK_SIZE;
const quint8 XInstallShieldDecoder::N_ZLIB_MARKER;

XInstallShieldDecoder::XInstallShieldDecoder(QObject *pParent) : QObject(pParent)
{
}

QByteArray XInstallShieldDecoder::getKey(const QByteArray &baFileName)
{
    QByteArray baResult = baFileName;

    qint32 nSize = baResult.size();

    for (qint32 i = 0; i < nSize; i++) {
        baResult[i] = (char)((quint8)baResult.at(i) ^ g_XOR_MAGIC[i % 4]);
    }

    return baResult;
}

void XInstallShieldDecoder::_xorBlocks(char *pData, qint64 nSize, const QByteArray &baKey)
{
    qint32 nKeySize = baKey.size();
    const char *pKey = baKey.constData();

    for (qint64 nBlockOffset = 0; nBlockOffset < nSize; nBlockOffset += N_BLOCK_SIZE) {
        qint32 nBlockSize = (qint32)qMin((qint64)N_BLOCK_SIZE, nSize - nBlockOffset);
        char *pBlock = pData + nBlockOffset;

        // The index restarts with every block
        for (qint32 i = 0; i < nBlockSize; i++) {
            pBlock[i] = (char)((quint8)pBlock[i] ^ g_XOR_MAGIC[i % 4] ^ (quint8)pKey[i % nKeySize]);
        }
    }
}

QByteArray XInstallShieldDecoder::decrypt(const QByteArray &baData, const QByteArray &baFileName)
{
    QByteArray baResult = baData;

    QByteArray baKey = getKey(baFileName);

    if (!baKey.isEmpty()) {
        _xorBlocks(baResult.data(), baResult.size(), baKey);
    }

    return baResult;
}

QByteArray XInstallShieldDecoder::encrypt(const QByteArray &baData, const QByteArray &baFileName)
{
    return decrypt(baData, baFileName);
}

bool XInstallShieldDecoder::inflate(const QByteArray &baData, QByteArray *pbaResult, qint64 nMaxSize, XBinary::PDSTRUCT *pPdStruct)
{
    bool bResult = false;

    XBinary::PDSTRUCT pdStructEmpty = XBinary::createPdStruct();

    if (!pPdStruct) {
        pPdStruct = &pdStructEmpty;
    }

    if (pbaResult) {
        pbaResult->clear();

        char bufferOut[N_INFLATE_BUFFER_SIZE];

        z_stream strm;

        strm.zalloc = nullptr;
        strm.zfree = nullptr;
        strm.opaque = nullptr;
        strm.avail_in = (uInt)baData.size();
        strm.next_in = (Bytef *)baData.constData();

        qint32 ret = Z_OK;
        bool bLimit = false;

        if (inflateInit(&strm) == Z_OK) {
            do {
                strm.avail_out = N_INFLATE_BUFFER_SIZE;
                strm.next_out = (Bytef *)bufferOut;
                ret = ::inflate(&strm, Z_NO_FLUSH);

                // Z_BUF_ERROR: the whole input is already supplied, so the stream is truncated
                if ((ret == Z_DATA_ERROR) || (ret == Z_MEM_ERROR) || (ret == Z_NEED_DICT) || (ret == Z_STREAM_ERROR) || (ret == Z_BUF_ERROR)) {
                    break;
                }

                qint32 nTemp = N_INFLATE_BUFFER_SIZE - strm.avail_out;

                if ((nMaxSize > 0) && ((pbaResult->size() + (qint64)nTemp) > nMaxSize)) {
                    bLimit = true;
                    break;
                }

                if (nTemp > 0) {
                    pbaResult->append(bufferOut, nTemp);
                }

                if (!XBinary::isPdStructNotCanceled(pPdStruct)) {
                    break;
                }
            } while (ret != Z_STREAM_END);

            inflateEnd(&strm);

            bResult = (ret == Z_STREAM_END) && (!bLimit);
        }
    }

    return bResult;
}

XInstallShieldDecoder::DECODE_RESULT XInstallShieldDecoder::decode(const QByteArray &baData, const QByteArray &baFileName, QByteArray *pbaResult,
                                                                   qint64 nMaxSize, XBinary::PDSTRUCT *pPdStruct)
{
    DECODE_RESULT result = DECODE_RESULT_OK;

    if (baFileName.isEmpty()) {
        // No key material
        *pbaResult = baData;
        result = DECODE_RESULT_UNDECODABLE;
    } else {
        QByteArray baDecrypted = decrypt(baData, baFileName);

        if ((!baDecrypted.isEmpty()) && ((quint8)baDecrypted.at(0) == N_ZLIB_MARKER)) {
            QByteArray baInflated;

            if (inflate(baDecrypted, &baInflated, nMaxSize, pPdStruct)) {
                *pbaResult = baInflated;
            } else {
                *pbaResult = baDecrypted;
                result = DECODE_RESULT_CORRUPTPAYLOAD;
            }
        } else {
            *pbaResult = baDecrypted;
        }
    }

    return result;
}
