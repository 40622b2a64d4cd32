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
#include "iszbuilder.h"

#include <QFile>
#include <QtEndian>

#include <bzlib.h>
#include <zlib.h>

#include "xisz.h"

ISZBuilder::ISZBuilder(quint32 nBlockSize)
{
    g_nBlockSize = nBlockSize;
}

void ISZBuilder::addZeros(quint32 nSize)
{
    addStored(XISZ_DEF::STORAGE_METHOD_ZEROS, QByteArray(), QByteArray((qint32)nSize, 0));
}

void ISZBuilder::addData(const QByteArray &baData)
{
    addStored(XISZ_DEF::STORAGE_METHOD_DATA, baData, baData);
}

void ISZBuilder::addZlib(const QByteArray &baData)
{
    addStored(XISZ_DEF::STORAGE_METHOD_ZLIB, compressZlib(baData), baData);
}

void ISZBuilder::addBzip2(const QByteArray &baData)
{
    addStored(XISZ_DEF::STORAGE_METHOD_BZIP2, compressBzip2(baData), baData);
}

void ISZBuilder::addStored(XISZ_DEF::STORAGE_METHOD storageMethod, const QByteArray &baStored, const QByteArray &baUncompressed)
{
    XISZ_DEF::CHUNK_POINTER chunkPointer = {};
    chunkPointer.storageMethod = storageMethod;
    chunkPointer.nSize = (storageMethod == XISZ_DEF::STORAGE_METHOD_ZEROS) ? (quint32)baUncompressed.size() : (quint32)baStored.size();

    g_listChunkPointers.append(chunkPointer);
    g_listStored.append(baStored);
    g_listUncompressed.append(baUncompressed);
}

QByteArray ISZBuilder::getUncompressed()
{
    QByteArray baResult;

    for (qint32 i = 0; i < g_listUncompressed.count(); i++) {
        baResult.append(g_listUncompressed.at(i));
    }

    return baResult;
}

QByteArray ISZBuilder::getStored()
{
    QByteArray baResult;

    for (qint32 i = 0; i < g_listStored.count(); i++) {
        baResult.append(g_listStored.at(i));
    }

    return baResult;
}

quint32 ISZBuilder::getUncompressedCRC()
{
    return calcCRC(getUncompressed());
}

quint32 ISZBuilder::getCompressedCRC()
{
    return calcCRC(getStored());
}

QList<XISZ_DEF::CHUNK_POINTER> ISZBuilder::getChunkPointers()
{
    return g_listChunkPointers;
}

XISZ_DEF::HEADER ISZBuilder::createHeader()
{
    XISZ_DEF::HEADER result = {};

    qint32 nNumberOfBlocks = g_listChunkPointers.count();
    qint64 nUncompressedSize = getUncompressed().size();

    result.nSignature = XISZ_DEF::S_SIGNATURE;
    result.nHeaderSize = XISZ_DEF::HEADER_SIZE;
    result.nVersion = XISZ_DEF::S_VERSION;
    result.nVolumeSerialNumber = 0x1234ABCD;
    result.nSectorSize = 512;
    result.nTotalSectors = (quint32)((nUncompressedSize + 511) / 512);
    result.nEncryptionType = XISZ_DEF::ENCRYPTION_TYPE_NONE;
    result.nSegmentSize = 0;
    result.nNumberOfBlocks = nNumberOfBlocks;
    result.nBlockSize = g_nBlockSize;
    result.nPointerLength = XISZ_DEF::POINTER_LENGTH;
    result.nFileSegmentNumber = 0;
    result.nChunkPointersOffset = XISZ_DEF::HEADER_SIZE;
    result.nSegmentPointersOffset = 0;
    result.nDataOffset = XISZ_DEF::HEADER_SIZE + XISZ_DEF::POINTER_LENGTH * nNumberOfBlocks;
    result.nChecksum1 = getUncompressedCRC();
    result.nSize1 = getStored().size();
    result.nChecksum2 = getCompressedCRC();

    return result;
}

bool ISZBuilder::writeSingle(const QString &sFileName, const XISZ_DEF::HEADER &header)
{
    QByteArray baFile = XISZ::headerToByteArray(header);
    baFile.append(_getChunkTable());
    baFile.append(getStored());

    return writeFile(sFileName, baFile);
}

bool ISZBuilder::writeSingle(const QString &sFileName)
{
    return writeSingle(sFileName, createHeader());
}

bool ISZBuilder::writeSegments(const QStringList &listFileNames, qint64 nSegmentDataSize, QList<XISZ_DEF::SEGMENT> *pListSegments)
{
    QByteArray baStored = getStored();
    qint32 nNumberOfSegments = listFileNames.count();
    qint32 nNumberOfBlocks = g_listChunkPointers.count();

    XISZ_DEF::HEADER header = createHeader();
    header.nSegmentSize = nSegmentDataSize;
    header.nSegmentPointersOffset = XISZ_DEF::HEADER_SIZE;
    header.nChunkPointersOffset = XISZ_DEF::HEADER_SIZE + XISZ_DEF::SEGMENT_RECORD_SIZE * (nNumberOfSegments + 1);
    header.nDataOffset = header.nChunkPointersOffset + XISZ_DEF::POINTER_LENGTH * nNumberOfBlocks;

    QList<XISZ_DEF::SEGMENT> listSegments;

    for (qint32 i = 0; i < nNumberOfSegments; i++) {
        XISZ_DEF::SEGMENT segment = {};
        segment.nFirstChunkNumber = -1;
        listSegments.append(segment);
    }

    // Assign every block to the segment holding its first byte
    qint64 nPos = 0;

    for (qint32 i = 0; i < nNumberOfBlocks; i++) {
        qint32 nSegment = (qint32)qMin(nPos / nSegmentDataSize, (qint64)(nNumberOfSegments - 1));
        XISZ_DEF::SEGMENT &segment = listSegments[nSegment];

        qint64 nBase = (nSegment == 0) ? header.nDataOffset : XISZ_DEF::HEADER_SIZE;

        if (segment.nFirstChunkNumber == -1) {
            segment.nFirstChunkNumber = i;
            segment.nChunkOffset = (qint32)(nBase + (nPos - nSegment * nSegmentDataSize));
        }

        segment.nNumberOfChunks++;

        if (g_listChunkPointers.at(i).storageMethod != XISZ_DEF::STORAGE_METHOD_ZEROS) {
            nPos += g_listChunkPointers.at(i).nSize;

            qint64 nSegmentEnd = (nSegment + 1) * nSegmentDataSize;

            if ((nSegment < (nNumberOfSegments - 1)) && (nPos > nSegmentEnd)) {
                segment.nLeftSize = (qint32)(nPos - nSegmentEnd);
            }
        }
    }

    QByteArray baSegmentTable;

    for (qint32 i = 0; i < nNumberOfSegments; i++) {
        qint64 nStart = i * nSegmentDataSize;
        qint64 nEnd = (i == (nNumberOfSegments - 1)) ? baStored.size() : qMin((qint64)baStored.size(), nStart + nSegmentDataSize);

        listSegments[i].nSize = qMax(nEnd - nStart, (qint64)1);

        if (listSegments[i].nFirstChunkNumber == -1) {
            listSegments[i].nFirstChunkNumber = nNumberOfBlocks;
        }

        baSegmentTable.append(packSegment(listSegments.at(i)));
    }

    baSegmentTable.append(QByteArray(XISZ_DEF::SEGMENT_RECORD_SIZE, 0));  // size == 0 terminates the table

    bool bResult = true;

    for (qint32 i = 0; (i < nNumberOfSegments) && bResult; i++) {
        XISZ_DEF::HEADER _header = header;
        _header.nFileSegmentNumber = (qint8)i;

        QByteArray baFile = XISZ::headerToByteArray(_header);

        if (i == 0) {
            baFile.append(XISZ::xorObfuscate(baSegmentTable));
            baFile.append(_getChunkTable());
        }

        baFile.append(baStored.mid((qint32)(i * nSegmentDataSize), (qint32)nSegmentDataSize));

        if (i == (nNumberOfSegments - 1)) {
            baFile.append(baStored.mid((qint32)((i + 1) * nSegmentDataSize)));
        }

        bResult = writeFile(listFileNames.at(i), baFile);
    }

    if (pListSegments) {
        *pListSegments = listSegments;
    }

    return bResult;
}

QByteArray ISZBuilder::compressZlib(const QByteArray &baData)
{
    uLongf nDestSize = compressBound((uLong)baData.size());
    QByteArray baResult((qint32)nDestSize, 0);

    if (compress2((Bytef *)baResult.data(), &nDestSize, (const Bytef *)baData.constData(), (uLong)baData.size(), Z_BEST_COMPRESSION) == Z_OK) {
        baResult.resize((qint32)nDestSize);
    } else {
        baResult.clear();
    }

    return baResult;
}

QByteArray ISZBuilder::compressBzip2(const QByteArray &baData)
{
    unsigned int nDestSize = (unsigned int)(baData.size() + baData.size() / 100 + 600);
    QByteArray baResult((qint32)nDestSize, 0);

    if (BZ2_bzBuffToBuffCompress(baResult.data(), &nDestSize, const_cast<char *>(baData.constData()), (unsigned int)baData.size(), 9, 0, 0) == BZ_OK) {
        baResult.resize((qint32)nDestSize);

        // ISZ does not store the 'BZh' signature
        baResult[0] = 0;
        baResult[1] = 0;
        baResult[2] = 0;
    } else {
        baResult.clear();
    }

    return baResult;
}

QByteArray ISZBuilder::packChunkPointer(XISZ_DEF::STORAGE_METHOD storageMethod, quint32 nSize)
{
    quint32 nValue = ((quint32)storageMethod << XISZ_DEF::CHUNK_METHOD_SHIFT) | (nSize & XISZ_DEF::CHUNK_SIZE_MASK);

    QByteArray baResult(XISZ_DEF::POINTER_LENGTH, 0);
    baResult[0] = (char)(nValue & 0xFF);
    baResult[1] = (char)((nValue >> 8) & 0xFF);
    baResult[2] = (char)((nValue >> 16) & 0xFF);

    return baResult;
}

QByteArray ISZBuilder::packSegment(const XISZ_DEF::SEGMENT &segment)
{
    QByteArray baResult(XISZ_DEF::SEGMENT_RECORD_SIZE, 0);
    char *pData = baResult.data();

    qToLittleEndian<qint64>(segment.nSize, pData);
    qToLittleEndian<qint32>(segment.nNumberOfChunks, pData + 8);
    qToLittleEndian<qint32>(segment.nFirstChunkNumber, pData + 12);
    qToLittleEndian<qint32>(segment.nChunkOffset, pData + 16);
    qToLittleEndian<qint32>(segment.nLeftSize, pData + 20);

    return baResult;
}

quint32 ISZBuilder::calcCRC(const QByteArray &baData)
{
    quint32 nCRC = (quint32)crc32(0, (const Bytef *)baData.constData(), (uInt)baData.size());

    return ~nCRC;
}

QByteArray ISZBuilder::createPattern(qint32 nSize, quint8 nSeed)
{
    QByteArray baResult(nSize, 0);

    quint32 nState = nSeed + 1;

    for (qint32 i = 0; i < nSize; i++) {
        nState = nState * 1103515245 + 12345;
        baResult[i] = (char)((nState >> 16) & 0x0F);  // low entropy, compresses well
    }

    return baResult;
}

bool ISZBuilder::writeFile(const QString &sFileName, const QByteArray &baData)
{
    bool bResult = false;

    QFile file(sFileName);

    if (file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        bResult = (file.write(baData) == baData.size());
        file.close();
    }

    return bResult;
}

QByteArray ISZBuilder::_getChunkTable()
{
    QByteArray baTable;

    for (qint32 i = 0; i < g_listChunkPointers.count(); i++) {
        baTable.append(packChunkPointer(g_listChunkPointers.at(i).storageMethod, g_listChunkPointers.at(i).nSize));
    }

    return XISZ::xorObfuscate(baTable);
}
