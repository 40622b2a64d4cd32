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
#include "xdeflatedecoder.h"

#include <zlib.h>

const qint32 N_BUFFER_SIZE = 0x4000;

XDeflateDecoder::XDeflateDecoder(QObject *pParent) : QObject(pParent)
{
}

bool XDeflateDecoder::decompress_zlib(XDecoder::DECOMPRESS_STATE *pDecompressState)
{
    bool bResult = false;

    if (pDecompressState && pDecompressState->pDeviceInput) {
        XDecoder::_resetState(pDecompressState);
    }

    if (pDecompressState && pDecompressState->pDeviceInput && !pDecompressState->bReadError) {
        char *bufferIn = new char[N_BUFFER_SIZE];
        char *bufferOut = new char[N_BUFFER_SIZE];

        z_stream strm;

        strm.zalloc = nullptr;
        strm.zfree = nullptr;
        strm.opaque = nullptr;
        strm.avail_in = 0;
        strm.next_in = nullptr;

        qint32 ret = Z_OK;

        // zlib header and adler32 trailer are checked by inflate
        if (inflateInit(&strm) == Z_OK) {
            do {
                strm.avail_in = XDecoder::_readDevice(bufferIn, N_BUFFER_SIZE, pDecompressState);

                if (strm.avail_in == 0) {
                    ret = Z_ERRNO;
                    break;
                }

                strm.next_in = (quint8 *)bufferIn;

                do {
                    strm.avail_out = N_BUFFER_SIZE;
                    strm.next_out = (quint8 *)bufferOut;
                    ret = inflate(&strm, Z_NO_FLUSH);

                    if ((ret == Z_DATA_ERROR) || (ret == Z_MEM_ERROR) || (ret == Z_NEED_DICT) || (ret == Z_STREAM_ERROR)) {
                        break;
                    }

                    qint32 nTemp = N_BUFFER_SIZE - strm.avail_out;

                    if (nTemp > 0) {
                        if (!XDecoder::_writeDevice(bufferOut, nTemp, pDecompressState)) {
                            ret = Z_ERRNO;
                            break;
                        }
                    }
                } while ((strm.avail_out == 0) && (ret != Z_STREAM_END));

                if ((ret == Z_DATA_ERROR) || (ret == Z_MEM_ERROR) || (ret == Z_NEED_DICT) || (ret == Z_STREAM_ERROR) || (ret == Z_ERRNO)) {
                    break;
                }
            } while (ret != Z_STREAM_END);

            inflateEnd(&strm);

            bResult = (ret == Z_STREAM_END);
        }

        delete[] bufferIn;
        delete[] bufferOut;
    }

    return bResult;
}
