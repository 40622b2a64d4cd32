/* Copyright (c) 2026 hors<horsicq@gmail.com>
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
#include "xdecompress.h"

#include <QBuffer>
#ifdef QT_DEBUG
#include <QDebug>
#endif

XDecompress::XDecompress(QObject *pParent) : QObject(pParent)
{
}

bool XDecompress::decompress(XDecoder::DECOMPRESS_STATE *pState, XDecoder::COMPRESS_METHOD compressMethod)
{
    bool bResult = false;

    if (compressMethod == XDecoder::COMPRESS_METHOD_STORE) {
        bResult = XStoreDecoder::decompress(pState);
    } else if (compressMethod == XDecoder::COMPRESS_METHOD_ZLIB) {
        bResult = XDeflateDecoder::decompress_zlib(pState);
    } else if (compressMethod == XDecoder::COMPRESS_METHOD_BZIP2) {
        bResult = XBZIP2Decoder::decompress(pState);
    } else {
#ifdef QT_DEBUG
        qDebug() << "Unknown compression method" << compressMethodToString(compressMethod);
#endif
        emit errorMessage(QString("%1: %2").arg(tr("Unknown compression method"), compressMethodToString(compressMethod)));
    }

    return bResult;
}

QByteArray XDecompress::decompressToByteArray(QIODevice *pDevice, qint64 nOffset, qint64 nSize, XDecoder::COMPRESS_METHOD compressMethod, bool *pbResult)
{
    QByteArray baResult;
    bool bResult = false;

    if (pDevice) {
        QBuffer buffer(&baResult);

        if (buffer.open(QIODevice::WriteOnly)) {
            XDecoder::DECOMPRESS_STATE state = {};
            state.pDeviceInput = pDevice;
            state.pDeviceOutput = &buffer;
            state.nInputOffset = nOffset;
            state.nInputLimit = nSize;

            bResult = decompress(&state, compressMethod);

            buffer.close();
        }
    }

    if (!bResult) {
        baResult.clear();
    }

    if (pbResult) {
        *pbResult = bResult;
    }

    return baResult;
}

QString XDecompress::compressMethodToString(XDecoder::COMPRESS_METHOD compressMethod)
{
    QString sResult = tr("Unknown");

    switch (compressMethod) {
        case XDecoder::COMPRESS_METHOD_STORE: sResult = QString("Store"); break;
        case XDecoder::COMPRESS_METHOD_ZLIB: sResult = QString("Zlib"); break;
        case XDecoder::COMPRESS_METHOD_BZIP2: sResult = QString("BZip2"); break;
        default: break;
    }

    return sResult;
}
