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
#include "xdecoder.h"

XDecoder::XDecoder(QObject *pParent) : QObject(pParent)
{
}

qint32 XDecoder::_readDevice(char *pBuffer, qint32 nBufferSize, DECOMPRESS_STATE *pState)
{
    qint32 nResult = 0;

    if (pState->nInputLimit != -1) {
        nBufferSize = (qint32)qMin((qint64)nBufferSize, pState->nInputLimit - pState->nCountInput);
    }

    if (nBufferSize > 0) {
        qint64 nRead = pState->pDeviceInput->read(pBuffer, nBufferSize);

        if (nRead < 0) {
            pState->bReadError = true;
        } else {
            nResult = (qint32)nRead;
            pState->nCountInput += nRead;
        }
    }

    return nResult;
}

bool XDecoder::_writeDevice(char *pBuffer, qint32 nBufferSize, DECOMPRESS_STATE *pState)
{
    bool bResult = true;

    qint64 nWritten = pState->pDeviceOutput->write(pBuffer, nBufferSize);

    if (nWritten != nBufferSize) {
        pState->bWriteError = true;
        bResult = false;
    }

    if (bResult) {
        pState->nCountOutput += nBufferSize;
    }

    return bResult;
}

void XDecoder::_resetState(DECOMPRESS_STATE *pState)
{
    pState->nCountInput = 0;
    pState->nCountOutput = 0;
    pState->bReadError = false;
    pState->bWriteError = false;

    if (pState->pDeviceInput && (!pState->pDeviceInput->seek(pState->nInputOffset))) {
        pState->bReadError = true;
    }
}
