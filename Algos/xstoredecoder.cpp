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
#include "xstoredecoder.h"

const qint32 N_BUFFER_SIZE = 65536;

XStoreDecoder::XStoreDecoder(QObject *pParent) : QObject(pParent)
{
}

bool XStoreDecoder::decompress(XDecoder::DECOMPRESS_STATE *pDecompressState)
{
    bool bResult = false;

    if (pDecompressState && pDecompressState->pDeviceInput) {
        XDecoder::_resetState(pDecompressState);

        char bufferIn[N_BUFFER_SIZE];

        while (!pDecompressState->bReadError && !pDecompressState->bWriteError) {
            qint32 nRead = XDecoder::_readDevice(bufferIn, N_BUFFER_SIZE, pDecompressState);

            if (nRead <= 0) {
                break;
            }

            XDecoder::_writeDevice(bufferIn, nRead, pDecompressState);
        }

        bResult = !pDecompressState->bReadError && !pDecompressState->bWriteError;

        // Truncated input
        if ((pDecompressState->nInputLimit != -1) && (pDecompressState->nCountInput != pDecompressState->nInputLimit)) {
            pDecompressState->bReadError = true;
            bResult = false;
        }
    }

    return bResult;
}
