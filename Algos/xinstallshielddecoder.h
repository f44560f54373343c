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
#ifndef XINSTALLSHIELDDECODER_H
#define XINSTALLSHIELDDECODER_H

#include "xbinary.h"

class XInstallShieldDecoder : public QObject {
    Q_OBJECT

public:
    enum DECODE_RESULT {
        DECODE_RESULT_OK = 0,
        DECODE_RESULT_UNDECODABLE,
        DECODE_RESULT_CORRUPTPAYLOAD
    };

    static const qint32 N_BLOCK_SIZE = 1024;
    static const quint8 N_ZLIB_MARKER = 0x78;

    explicit XInstallShieldDecoder(QObject *pParent = nullptr);

    static QByteArray getKey(const QByteArray &baFileName);
    // Encryption and decryption are the same operation
    static QByteArray decrypt(const QByteArray &baData, const QByteArray &baFileName);
    static QByteArray encrypt(const QByteArray &baData, const QByteArray &baFileName);
    // nMaxSize <= 0: no limit on the inflated size
    static bool inflate(const QByteArray &baData, QByteArray *pbaResult, qint64 nMaxSize = -1, XBinary::PDSTRUCT *pPdStruct = nullptr);
    static DECODE_RESULT decode(const QByteArray &baData, const QByteArray &baFileName, QByteArray *pbaResult, qint64 nMaxSize = -1,
                                XBinary::PDSTRUCT *pPdStruct = nullptr);

private:
    static void _xorBlocks(char *pData, qint64 nSize, const QByteArray &baKey);
};

#endif  // XINSTALLSHIELDDECODER_H
