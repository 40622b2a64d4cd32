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
#ifndef XDECOMPRESS_H
#define XDECOMPRESS_H

#include "xbzip2decoder.h"
#include "xdeflatedecoder.h"
#include "xstoredecoder.h"

class XDecompress : public QObject {
    Q_OBJECT

public:
    explicit XDecompress(QObject *pParent = nullptr);

    bool decompress(XDecoder::DECOMPRESS_STATE *pState, XDecoder::COMPRESS_METHOD compressMethod);
    QByteArray decompressToByteArray(QIODevice *pDevice, qint64 nOffset, qint64 nSize, XDecoder::COMPRESS_METHOD compressMethod, bool *pbResult = nullptr);
    static QString compressMethodToString(XDecoder::COMPRESS_METHOD compressMethod);

signals:
    void errorMessage(const QString &sText);
};

#endif  // XDECOMPRESS_H
