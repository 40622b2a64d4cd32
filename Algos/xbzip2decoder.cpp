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
#include "xbzip2decoder.h"

#include <bzlib.h>

XBZIP2Decoder::XBZIP2Decoder(QObject *pParent) : QObject(pParent)
{
}

bool XBZIP2Decoder::decompress(XDecoder::DECOMPRESS_STATE *pDecompressState)
{
    bool bResult = false;

    const qint32 N_BUFFER_SIZE = 0x4000;

    char bufferIn[N_BUFFER_SIZE];
    char bufferOut[N_BUFFER_SIZE];

    if (pDecompressState && pDecompressState->pDeviceInput) {
        XDecoder::_resetState(pDecompressState);
    }

    if (pDecompressState && pDecompressState->pDeviceInput && !pDecompressState->bReadError) {
        bz_stream strm = {};
        qint32 ret = BZ_MEM_ERROR;

        qint32 rc = BZ2_bzDecompressInit(&strm, 0, 0);

        if (rc == BZ_OK) {
            do {
                strm.avail_in = XDecoder::_readDevice(bufferIn, N_BUFFER_SIZE, pDecompressState);

                if (strm.avail_in == 0) {
                    ret = BZ_UNEXPECTED_EOF;
                    break;
                }

                strm.next_in = bufferIn;

                do {
                    strm.avail_out = N_BUFFER_SIZE;
                    strm.next_out = bufferOut;
                    ret = BZ2_bzDecompress(&strm);

                    if ((ret != BZ_STREAM_END) && (ret != BZ_OK)) {
                        break;
                    }

                    qint32 nTemp = N_BUFFER_SIZE - strm.avail_out;

                    if (nTemp > 0) {
                        if (!XDecoder::_writeDevice(bufferOut, nTemp, pDecompressState)) {
                            ret = BZ_IO_ERROR;
                            break;
                        }
                    }
                } while ((strm.avail_out == 0) && (ret != BZ_STREAM_END));

                if (ret != BZ_OK) {
                    break;
                }
            } while (ret != BZ_STREAM_END);

            BZ2_bzDecompressEnd(&strm);

            if (ret == BZ_STREAM_END) {
                bResult = true;
            }
        }
    }

    return bResult;
}
