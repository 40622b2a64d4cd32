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
#ifndef XDECODER_H
#define XDECODER_H

#include <QIODevice>
#include <QObject>

class XDecoder : public QObject {
    Q_OBJECT

public:
    enum COMPRESS_METHOD {
        COMPRESS_METHOD_UNKNOWN = 0,
        COMPRESS_METHOD_STORE,
        COMPRESS_METHOD_ZLIB,
        COMPRESS_METHOD_BZIP2
    };

    struct DECOMPRESS_STATE {
        QIODevice *pDeviceInput;
        QIODevice *pDeviceOutput;
        qint64 nInputOffset;
        qint64 nInputLimit;
        qint64 nCountInput;
        qint64 nCountOutput;
        bool bReadError;
        bool bWriteError;
    };

    explicit XDecoder(QObject *pParent = nullptr);

    static qint32 _readDevice(char *pBuffer, qint32 nBufferSize, DECOMPRESS_STATE *pState);
    static bool _writeDevice(char *pBuffer, qint32 nBufferSize, DECOMPRESS_STATE *pState);
    static void _resetState(DECOMPRESS_STATE *pState);
};

#endif  // XDECODER_H
