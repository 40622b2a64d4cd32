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
#include "xisz.h"

#include <QBuffer>
#include <QFileInfo>
#include <QtEndian>
#ifdef QT_DEBUG
#include <QDebug>
#endif

#include <zlib.h>

XISZ::XISZ(QObject *pParent) : QObject(pParent)
{
    g_pFile = nullptr;
    g_header = XISZ_DEF::HEADER();
    g_naming = NAMING_NOCHANGE;
    g_lastError = ISZ_ERROR_NONE;
}

XISZ::~XISZ()
{
    close();
}

bool XISZ::open(const QString &sFileName)
{
    close();
    _clearError();

    bool bResult = false;

    g_sFileName = sFileName;
    g_pFile = new QFile(sFileName);

    if (g_pFile->open(QIODevice::ReadOnly)) {
        QString sErrorString;

        if (readHeader(g_pFile, &g_header, &sErrorString)) {
            if (g_header.nFileSegmentNumber != 0) {
                _setError(ISZ_ERROR_FORMAT, QString("%1 (%2)").arg(tr("Not the first segment in a set"), QString::number(g_header.nFileSegmentNumber)));
            } else if (isEncrypted()) {
                // Only the header is available
                bResult = true;
            } else {
                bResult = _readSegments() && _readChunkPointers();
            }
        } else {
            _setError(ISZ_ERROR_FORMAT, sErrorString);
        }
    } else {
        _setError(ISZ_ERROR_NOTFOUND, QString("%1: %2").arg(tr("Unable to open file"), sFileName));
    }

    if (!bResult) {
        close();
    }

    return bResult;
}

void XISZ::close()
{
    if (g_pFile) {
        g_pFile->close();
        delete g_pFile;
        g_pFile = nullptr;
    }

    g_sFileName.clear();
    g_header = XISZ_DEF::HEADER();
    g_listSegments.clear();
    g_listChunkPointers.clear();
    g_naming = NAMING_NOCHANGE;
}

bool XISZ::isOpen()
{
    return (g_pFile != nullptr);
}

bool XISZ::isValid(QIODevice *pDevice)
{
    bool bResult = false;

    if (pDevice && pDevice->seek(0)) {
        XISZ_DEF::HEADER header = {};
        bResult = readHeader(pDevice, &header);
    }

    return bResult;
}

bool XISZ::readHeader(QIODevice *pDevice, XISZ_DEF::HEADER *pHeader, QString *psErrorString)
{
    bool bResult = false;

    QString sErrorString;
    XISZ_DEF::HEADER header = {};

    if (pDevice) {
        QByteArray baHeader = pDevice->read(XISZ_DEF::HEADER_SIZE);

        if (baHeader.size() == XISZ_DEF::HEADER_SIZE) {
            const char *pData = baHeader.constData();

            header.nSignature = qFromLittleEndian<quint32>(pData);
            header.nHeaderSize = (quint8)pData[0x04];
            header.nVersion = (quint8)pData[0x05];
            header.nVolumeSerialNumber = qFromLittleEndian<quint32>(pData + 0x06);
            header.nSectorSize = qFromLittleEndian<quint16>(pData + 0x0A);
            header.nTotalSectors = qFromLittleEndian<quint32>(pData + 0x0C);
            header.nEncryptionType = (quint8)pData[0x10];
            header.nSegmentSize = qFromLittleEndian<qint64>(pData + 0x11);
            header.nNumberOfBlocks = qFromLittleEndian<quint32>(pData + 0x19);
            header.nBlockSize = qFromLittleEndian<quint32>(pData + 0x1D);
            header.nPointerLength = (quint8)pData[0x21];
            header.nFileSegmentNumber = (qint8)pData[0x22];
            header.nChunkPointersOffset = qFromLittleEndian<quint32>(pData + 0x23);
            header.nSegmentPointersOffset = qFromLittleEndian<quint32>(pData + 0x27);
            header.nDataOffset = qFromLittleEndian<quint32>(pData + 0x2B);
            header.nReserved = (quint8)pData[0x2F];
            header.nChecksum1 = qFromLittleEndian<quint32>(pData + 0x30);
            header.nSize1 = qFromLittleEndian<quint32>(pData + 0x34);
            header.nUnknown2 = qFromLittleEndian<quint32>(pData + 0x38);
            header.nChecksum2 = qFromLittleEndian<quint32>(pData + 0x3C);

            if (header.nSignature != XISZ_DEF::S_SIGNATURE) {
                sErrorString = tr("Not an ISZ file (invalid signature)");
            } else if (header.nVersion != XISZ_DEF::S_VERSION) {
                sErrorString = QString("%1: %2").arg(tr("ISZ version not supported"), QString::number(header.nVersion));
            } else {
                bResult = true;
            }
        } else {
            sErrorString = tr("Unable to read the ISZ header, only got %1 bytes").arg(baHeader.size());
        }
    }

    if (pHeader) {
        *pHeader = header;
    }

    if (psErrorString) {
        *psErrorString = sErrorString;
    }

    return bResult;
}

QByteArray XISZ::headerToByteArray(const XISZ_DEF::HEADER &header)
{
    QByteArray baResult(XISZ_DEF::HEADER_SIZE, 0);
    char *pData = baResult.data();

    qToLittleEndian<quint32>(header.nSignature, pData);
    pData[0x04] = (char)header.nHeaderSize;
    pData[0x05] = (char)header.nVersion;
    qToLittleEndian<quint32>(header.nVolumeSerialNumber, pData + 0x06);
    qToLittleEndian<quint16>(header.nSectorSize, pData + 0x0A);
    qToLittleEndian<quint32>(header.nTotalSectors, pData + 0x0C);
    pData[0x10] = (char)header.nEncryptionType;
    qToLittleEndian<qint64>(header.nSegmentSize, pData + 0x11);
    qToLittleEndian<quint32>(header.nNumberOfBlocks, pData + 0x19);
    qToLittleEndian<quint32>(header.nBlockSize, pData + 0x1D);
    pData[0x21] = (char)header.nPointerLength;
    pData[0x22] = (char)header.nFileSegmentNumber;
    qToLittleEndian<quint32>(header.nChunkPointersOffset, pData + 0x23);
    qToLittleEndian<quint32>(header.nSegmentPointersOffset, pData + 0x27);
    qToLittleEndian<quint32>(header.nDataOffset, pData + 0x2B);
    pData[0x2F] = (char)header.nReserved;
    qToLittleEndian<quint32>(header.nChecksum1, pData + 0x30);
    qToLittleEndian<quint32>(header.nSize1, pData + 0x34);
    qToLittleEndian<quint32>(header.nUnknown2, pData + 0x38);
    qToLittleEndian<quint32>(header.nChecksum2, pData + 0x3C);

    return baResult;
}

XISZ_DEF::SEGMENT XISZ::decodeSegment(const char *pData)
{
    XISZ_DEF::SEGMENT result = {};

    result.nSize = qFromLittleEndian<qint64>(pData);
    result.nNumberOfChunks = qFromLittleEndian<qint32>(pData + 8);
    result.nFirstChunkNumber = qFromLittleEndian<qint32>(pData + 12);
    result.nChunkOffset = qFromLittleEndian<qint32>(pData + 16);
    result.nLeftSize = qFromLittleEndian<qint32>(pData + 20);

    return result;
}

XISZ_DEF::CHUNK_POINTER XISZ::decodeChunkPointer(const char *pData)
{
    XISZ_DEF::CHUNK_POINTER result = {};

    quint32 nValue = (quint32)(quint8)pData[0] | ((quint32)(quint8)pData[1] << 8) | ((quint32)(quint8)pData[2] << 16);

    result.storageMethod = (XISZ_DEF::STORAGE_METHOD)(nValue >> XISZ_DEF::CHUNK_METHOD_SHIFT);
    result.nSize = nValue & XISZ_DEF::CHUNK_SIZE_MASK;

    return result;
}

void XISZ::xorObfuscate(char *pData, qint64 nSize)
{
    for (qint64 i = 0; i < nSize; i++) {
        pData[i] = (char)((quint8)pData[i] ^ XISZ_DEF::XOR_KEY[i % 4]);
    }
}

QByteArray XISZ::xorObfuscate(const QByteArray &baData)
{
    QByteArray baResult = baData;

    xorObfuscate(baResult.data(), baResult.size());

    return baResult;
}

QString XISZ::getSegmentFileName(const QString &sFileName, NAMING naming, qint32 nIndex)
{
    QString sResult = sFileName;

    if (naming == NAMING_IXX) {
        if (nIndex != 0) {
            sResult.chop(4);
            sResult += QString(".i%1").arg(nIndex, 2, 10, QChar('0'));
        }
    } else if (naming == NAMING_PARTXX) {
        sResult.chop(11);
        sResult += QString(".part%1.isz").arg(nIndex + 1, 2, 10, QChar('0'));
    } else if (naming == NAMING_PARTXXX) {
        sResult.chop(12);
        sResult += QString(".part%1.isz").arg(nIndex + 1, 3, 10, QChar('0'));
    }

    return sResult;
}

bool XISZ::detectNaming(const QString &sFileName, NAMING *pNaming, QString *psErrorString)
{
    bool bResult = false;

    QString sErrorString;
    NAMING naming = NAMING_NOCHANGE;

    if (sFileName.endsWith(".isz", Qt::CaseInsensitive)) {
        QList<NAMING> listNamings;
        listNamings.append(NAMING_IXX);
        listNamings.append(NAMING_PARTXX);
        listNamings.append(NAMING_PARTXXX);

        qint32 nNumberOfNamings = listNamings.count();

        for (qint32 i = 0; i < nNumberOfNamings; i++) {
            if (QFileInfo::exists(getSegmentFileName(sFileName, listNamings.at(i), 1))) {
                naming = listNamings.at(i);
                bResult = true;
                break;
            }
        }

        if (!bResult) {
            sErrorString = tr("Unable to find the naming convention used for the multi-part ISZ file");
        }
    } else {
        sErrorString = tr("For multi-part ISZ files, the first file need to have an .isz extension");
    }

    if (pNaming) {
        *pNaming = naming;
    }

    if (psErrorString) {
        *psErrorString = sErrorString;
    }

    return bResult;
}

bool XISZ::locateBlock(const QList<XISZ_DEF::SEGMENT> &listSegments, const QList<XISZ_DEF::CHUNK_POINTER> &listChunkPointers, qint32 nBlock,
                       BLOCK_LOCATION *pLocation)
{
    bool bResult = false;

    if ((nBlock >= 0) && (nBlock < listChunkPointers.count())) {
        qint32 nNumberOfSegments = listSegments.count();

        for (qint32 i = 0; i < nNumberOfSegments; i++) {
            const XISZ_DEF::SEGMENT &segment = listSegments.at(i);

            qint64 nFirstBlock = segment.nFirstChunkNumber;
            qint64 nLastBlock = nFirstBlock + segment.nNumberOfChunks - 1;

            if ((nBlock >= nFirstBlock) && (nBlock <= nLastBlock)) {
                XISZ_DEF::CHUNK_POINTER chunkPointer = listChunkPointers.at(nBlock);

                // Zero chunks are not stored
                qint64 nOffset = segment.nChunkOffset;

                for (qint64 j = qMax(nFirstBlock, (qint64)0); j < nBlock; j++) {
                    const XISZ_DEF::CHUNK_POINTER &previous = listChunkPointers.at(j);

                    if (previous.storageMethod != XISZ_DEF::STORAGE_METHOD_ZEROS) {
                        nOffset += previous.nSize;
                    }
                }

                BLOCK_LOCATION location = {};
                location.nSegment = i;
                location.nOffset = nOffset;

                if (chunkPointer.storageMethod != XISZ_DEF::STORAGE_METHOD_ZEROS) {
                    location.nSize = chunkPointer.nSize;

                    if ((nBlock == nLastBlock) && (segment.nLeftSize > 0)) {
                        location.nSize -= segment.nLeftSize;
                        location.nLeftSize = segment.nLeftSize;
                    }
                }

                if (pLocation) {
                    *pLocation = location;
                }

                bResult = true;

                break;
            }
        }
    }

    return bResult;
}

QString XISZ::encryptionTypeToString(quint8 nEncryptionType)
{
    QString sResult = tr("Unknown");

    switch (nEncryptionType) {
        case XISZ_DEF::ENCRYPTION_TYPE_NONE: sResult = QString("No password"); break;
        case XISZ_DEF::ENCRYPTION_TYPE_PASSWORD: sResult = QString("Password protected"); break;
        case XISZ_DEF::ENCRYPTION_TYPE_AES128: sResult = QString("Encrypted AES128"); break;
        case XISZ_DEF::ENCRYPTION_TYPE_AES192: sResult = QString("Encrypted AES192"); break;
        case XISZ_DEF::ENCRYPTION_TYPE_AES256: sResult = QString("Encrypted AES256"); break;
    }

    return sResult;
}

QString XISZ::storageMethodToString(XISZ_DEF::STORAGE_METHOD storageMethod)
{
    QString sResult = tr("Unknown");

    switch (storageMethod) {
        case XISZ_DEF::STORAGE_METHOD_ZEROS: sResult = QString("Zeros"); break;
        case XISZ_DEF::STORAGE_METHOD_DATA: sResult = QString("Data"); break;
        case XISZ_DEF::STORAGE_METHOD_ZLIB: sResult = QString("Zlib"); break;
        case XISZ_DEF::STORAGE_METHOD_BZIP2: sResult = QString("BZIP2"); break;
    }

    return sResult;
}

quint64 XISZ::getUncompressedSize(const XISZ_DEF::HEADER &header)
{
    return (quint64)header.nSectorSize * (quint64)header.nTotalSectors;
}

QString XISZ::getDefaultImageFileName(const QString &sFileName)
{
    QString sResult = sFileName;

    if (sResult.endsWith(".isz", Qt::CaseInsensitive)) {
        sResult.chop(4);
    }

    sResult += ".iso";

    return sResult;
}

XISZ_DEF::HEADER XISZ::getHeader()
{
    return g_header;
}

QList<XISZ_DEF::SEGMENT> XISZ::getSegments()
{
    return g_listSegments;
}

QList<XISZ_DEF::CHUNK_POINTER> XISZ::getChunkPointers()
{
    return g_listChunkPointers;
}

XISZ::NAMING XISZ::getNaming()
{
    return g_naming;
}

QString XISZ::getFileName()
{
    return g_sFileName;
}

QString XISZ::getSegmentFileName(qint32 nIndex)
{
    return getSegmentFileName(g_sFileName, g_naming, nIndex);
}

quint64 XISZ::getUncompressedSize()
{
    return getUncompressedSize(g_header);
}

quint32 XISZ::getVolumeSerialNumber()
{
    return g_header.nVolumeSerialNumber;
}

QString XISZ::getEncryptionTypeString()
{
    return encryptionTypeToString(g_header.nEncryptionType);
}

bool XISZ::isEncrypted()
{
    return (g_header.nEncryptionType != XISZ_DEF::ENCRYPTION_TYPE_NONE);
}

QString XISZ::getDescription()
{
    return QString("ISZ version %1, %2, volume serial number 0x%3, uncompressed size=%4 MB")
        .arg(QString::number(g_header.nVersion), getEncryptionTypeString(), QString::number(g_header.nVolumeSerialNumber, 16),
             QString::number(getUncompressedSize() / 1024 / 1024));
}

bool XISZ::readBlock(qint32 nBlock, QByteArray *pbaData)
{
    _clearError();

    bool bResult = false;

    if (_checkAccess()) {
        BLOCK_LOCATION location = {};

        if (locateBlock(g_listSegments, g_listChunkPointers, nBlock, &location)) {
            qint64 nBlockSize = location.nSize + location.nLeftSize;
            QByteArray baData;

            if (location.nSize < 0) {
                _setError(ISZ_ERROR_INTEGRITY, tr("Block %1: %2 left bytes exceed the block size %3").arg(nBlock).arg(location.nLeftSize).arg(nBlockSize));
            } else if (_readData(location.nSegment, location.nOffset, location.nSize, &baData)) {
                bool bSuccess = true;

                // A block can be split between two segments
                if (location.nLeftSize > 0) {
                    if ((location.nSegment + 1) < g_listSegments.count()) {
                        QByteArray baLeft;
                        bSuccess = _readData(location.nSegment + 1, XISZ_DEF::HEADER_SIZE, location.nLeftSize, &baLeft);
                        baData.append(baLeft);
                    } else {
                        _setError(ISZ_ERROR_NOTFOUND, tr("Block %1 continues in segment %2, which is not in the segment table").arg(nBlock).arg(location.nSegment + 1));
                        bSuccess = false;
                    }
                }

                if (bSuccess) {
                    if (baData.size() == nBlockSize) {
                        if (pbaData) {
                            *pbaData = baData;
                        }

                        bResult = true;
                    } else {
                        _setError(ISZ_ERROR_INTEGRITY, tr("Short read on block %1: %2 of %3 bytes").arg(nBlock).arg(baData.size()).arg(nBlockSize));
                    }
                }
            }
        } else {
            _setError(ISZ_ERROR_NOTFOUND, tr("Unable to find the segment of block %1").arg(nBlock));
        }
    }

    return bResult;
}

bool XISZ::decompressBlock(qint32 nBlock, QByteArray *pbaData)
{
    _clearError();

    bool bResult = false;

    if (_checkAccess()) {
        if ((nBlock >= 0) && (nBlock < g_listChunkPointers.count())) {
            XISZ_DEF::CHUNK_POINTER chunkPointer = g_listChunkPointers.at(nBlock);

            if (chunkPointer.storageMethod == XISZ_DEF::STORAGE_METHOD_ZEROS) {
                if (pbaData) {
                    *pbaData = QByteArray((qint32)chunkPointer.nSize, 0);
                }

                bResult = true;
            } else {
                QByteArray baData;

                if (readBlock(nBlock, &baData)) {
                    XDecoder::COMPRESS_METHOD compressMethod = XDecoder::COMPRESS_METHOD_STORE;

                    if (chunkPointer.storageMethod == XISZ_DEF::STORAGE_METHOD_ZLIB) {
                        compressMethod = XDecoder::COMPRESS_METHOD_ZLIB;
                    } else if (chunkPointer.storageMethod == XISZ_DEF::STORAGE_METHOD_BZIP2) {
                        compressMethod = XDecoder::COMPRESS_METHOD_BZIP2;

                        // The stream signature is stored mangled
                        if (baData.size() >= 3) {
                            baData[0] = 'B';
                            baData[1] = 'Z';
                            baData[2] = 'h';
                        }
                    }

                    QBuffer buffer(&baData);

                    if (buffer.open(QIODevice::ReadOnly)) {
                        XDecompress decompress;
                        connect(&decompress, &XDecompress::errorMessage, this, &XISZ::errorMessage);

                        bool bDecompress = false;
                        QByteArray baResult = decompress.decompressToByteArray(&buffer, 0, baData.size(), compressMethod, &bDecompress);

                        buffer.close();

                        if (bDecompress) {
                            if (pbaData) {
                                *pbaData = baResult;
                            }

                            bResult = true;
                        }
                    }

                    if (!bResult) {
                        _setError(ISZ_ERROR_DECOMPRESSION,
                                  tr("Unable to decompress block %1 (%2)").arg(QString::number(nBlock), storageMethodToString(chunkPointer.storageMethod)));
                    }
                }
            }
        } else {
            _setError(ISZ_ERROR_NOTFOUND, tr("Block %1 is out of range (%2 blocks)").arg(nBlock).arg(g_listChunkPointers.count()));
        }
    }

    return bResult;
}

bool XISZ::verifyCompressed()
{
    _clearError();

    bool bResult = false;

    if (_checkAccess()) {
        quint32 nCRC = 0;
        bool bSuccess = true;

        qint32 nNumberOfBlocks = g_listChunkPointers.count();

        for (qint32 i = 0; i < nNumberOfBlocks; i++) {
            if (g_listChunkPointers.at(i).storageMethod != XISZ_DEF::STORAGE_METHOD_ZEROS) {
                QByteArray baData;

                if (!readBlock(i, &baData)) {
                    bSuccess = false;
                    break;
                }

                nCRC = (quint32)crc32(nCRC, (const Bytef *)baData.constData(), (uInt)baData.size());
            }

            emit progressChanged(i + 1, nNumberOfBlocks);
        }

        if (bSuccess) {
            nCRC = ~nCRC;

            bResult = (nCRC == g_header.nChecksum2);

            if (!bResult) {
                emit warningMessage(tr("Invalid CRC of compressed data: 0x%1, expected 0x%2")
                                        .arg(QString::number(nCRC, 16), QString::number(g_header.nChecksum2, 16)));
            }
        }
    }

    return bResult;
}

bool XISZ::verifyUncompressed()
{
    _clearError();

    bool bResult = false;

    if (_checkAccess()) {
        quint32 nCRC = 0;

        if (_processUncompressed(nullptr, &nCRC)) {
            bResult = (nCRC == g_header.nChecksum1);

            if (!bResult) {
                emit warningMessage(tr("Invalid CRC of uncompressed data: 0x%1, expected 0x%2")
                                        .arg(QString::number(nCRC, 16), QString::number(g_header.nChecksum1, 16)));
            }
        }
    }

    return bResult;
}

bool XISZ::extract(QIODevice *pDevice)
{
    _clearError();

    bool bResult = false;

    if (_checkAccess()) {
        quint32 nCRC = 0;

        // Output already written is kept on failure
        if (_processUncompressed(pDevice, &nCRC)) {
            if (nCRC == g_header.nChecksum1) {
                bResult = true;
            } else {
                _setError(ISZ_ERROR_INTEGRITY,
                          tr("CRC mismatch on extraction: 0x%1, expected 0x%2").arg(QString::number(nCRC, 16), QString::number(g_header.nChecksum1, 16)));
            }
        }
    }

    return bResult;
}

bool XISZ::extractToFile(const QString &sFileName)
{
    _clearError();

    bool bResult = false;

    if (_checkAccess()) {
        QFile file(sFileName);

        if (file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
            bResult = extract(&file);

            file.close();
        } else {
            _setError(ISZ_ERROR_WRITE, QString("%1: %2").arg(tr("Unable to create file"), sFileName));
        }
    }

    return bResult;
}

XISZ::ISZ_ERROR XISZ::getLastError()
{
    return g_lastError;
}

QString XISZ::getErrorString()
{
    return g_sErrorString;
}

bool XISZ::_readSegments()
{
    bool bResult = true;

    if ((g_header.nNumberOfBlocks > 0x7FFFFFFFu) || (g_header.nDataOffset > 0x7FFFFFFFu)) {
        _setError(ISZ_ERROR_FORMAT, tr("Invalid block count or data offset: %1, 0x%2")
                                        .arg(QString::number(g_header.nNumberOfBlocks), QString::number(g_header.nDataOffset, 16)));
        bResult = false;
    } else if (g_header.nSegmentPointersOffset == 0) {
        XISZ_DEF::SEGMENT segment = {};
        segment.nSize = 0;
        segment.nNumberOfChunks = (qint32)g_header.nNumberOfBlocks;
        segment.nFirstChunkNumber = 0;
        segment.nChunkOffset = (qint32)g_header.nDataOffset;
        segment.nLeftSize = 0;

        g_listSegments.append(segment);
    } else if (g_pFile->seek(g_header.nSegmentPointersOffset)) {
        while (true) {
            QByteArray baRecord = g_pFile->read(XISZ_DEF::SEGMENT_RECORD_SIZE);

            if (baRecord.size() != XISZ_DEF::SEGMENT_RECORD_SIZE) {
                _setError(ISZ_ERROR_FORMAT, tr("Unable to read segment table entry %1").arg(g_listSegments.count()));
                bResult = false;
                break;
            }

            xorObfuscate(baRecord.data(), baRecord.size());

            XISZ_DEF::SEGMENT segment = decodeSegment(baRecord.constData());

            if (segment.nSize == 0) {
                break;
            }

            if ((segment.nNumberOfChunks < 0) || (segment.nFirstChunkNumber < 0) || (segment.nChunkOffset < 0) || (segment.nLeftSize < 0)) {
                _setError(ISZ_ERROR_FORMAT, tr("Invalid segment table entry %1").arg(g_listSegments.count()));
                bResult = false;
                break;
            }

            g_listSegments.append(segment);
        }

        if (bResult && g_listSegments.isEmpty()) {
            _setError(ISZ_ERROR_FORMAT, tr("Empty segment table"));
            bResult = false;
        }
    } else {
        _setError(ISZ_ERROR_FORMAT, tr("Invalid segment table offset: 0x%1").arg(QString::number(g_header.nSegmentPointersOffset, 16)));
        bResult = false;
    }

    if (bResult) {
        if (g_listSegments.count() > 1) {
            QString sErrorString;

            if (!detectNaming(g_sFileName, &g_naming, &sErrorString)) {
                _setError(ISZ_ERROR_FORMAT, sErrorString);
                bResult = false;
            }
        } else {
            g_naming = NAMING_NOCHANGE;
        }
    }

    if (bResult) {
        bResult = _checkSegmentFiles();
    }

    return bResult;
}

bool XISZ::_readChunkPointers()
{
    bool bResult = false;

    if (g_header.nChunkPointersOffset == 0) {
        // The whole image is one uncompressed chunk
        XISZ_DEF::CHUNK_POINTER chunkPointer = {};
        chunkPointer.storageMethod = XISZ_DEF::STORAGE_METHOD_DATA;
        chunkPointer.nSize = g_header.nSize1;

        g_listChunkPointers.append(chunkPointer);

        bResult = true;
    } else if (g_header.nPointerLength != XISZ_DEF::POINTER_LENGTH) {
        _setError(ISZ_ERROR_FORMAT, tr("Unsupported pointer width: %1").arg((qint32)g_header.nPointerLength));
    } else if (((qint64)g_header.nChunkPointersOffset + (qint64)g_header.nPointerLength * g_header.nNumberOfBlocks) > g_pFile->size()) {
        _setError(ISZ_ERROR_FORMAT, tr("The chunk pointer table of %1 blocks exceeds the file size").arg(QString::number(g_header.nNumberOfBlocks)));
    } else if (g_pFile->seek(g_header.nChunkPointersOffset)) {
        qint64 nTableSize = (qint64)g_header.nPointerLength * g_header.nNumberOfBlocks;

        QByteArray baTable = g_pFile->read(nTableSize);

        if (baTable.size() == nTableSize) {
            xorObfuscate(baTable.data(), baTable.size());

            const char *pData = baTable.constData();

            for (quint32 i = 0; i < g_header.nNumberOfBlocks; i++) {
                g_listChunkPointers.append(decodeChunkPointer(pData + i * XISZ_DEF::POINTER_LENGTH));
            }

            bResult = true;
        } else {
            _setError(ISZ_ERROR_FORMAT, tr("Unable to read the chunk pointer table: %1 of %2 bytes").arg(baTable.size()).arg(nTableSize));
        }
    } else {
        _setError(ISZ_ERROR_FORMAT, tr("Invalid chunk pointer table offset: 0x%1").arg(QString::number(g_header.nChunkPointersOffset, 16)));
    }

    return bResult;
}

bool XISZ::_checkSegmentFiles()
{
    bool bResult = true;

    qint32 nNumberOfSegments = g_listSegments.count();

    for (qint32 i = 0; i < nNumberOfSegments; i++) {
        QString sSegmentFileName = getSegmentFileName(i);

        if (!QFileInfo::exists(sSegmentFileName)) {
            _setError(ISZ_ERROR_NOTFOUND, tr("Unable to find segment %1: %2").arg(QString::number(i), sSegmentFileName));
            bResult = false;
            break;
        }
    }

    return bResult;
}

bool XISZ::_checkAccess()
{
    bool bResult = false;

    if (!isOpen()) {
        _setError(ISZ_ERROR_FORMAT, tr("No ISZ file is open"));
    } else if (isEncrypted()) {
        _setError(ISZ_ERROR_FORMAT, QString("%1: %2").arg(tr("Encryption not supported"), getEncryptionTypeString()));
    } else {
        bResult = true;
    }

    return bResult;
}

bool XISZ::_readData(qint32 nSegment, qint64 nOffset, qint64 nSize, QByteArray *pbaData)
{
    bool bResult = false;

    pbaData->clear();

    if (nSegment == 0) {
        if (g_pFile->seek(nOffset)) {
            *pbaData = g_pFile->read(nSize);
        }

        bResult = true;
    } else {
        QFile file(getSegmentFileName(nSegment));

        if (file.open(QIODevice::ReadOnly)) {
            if (file.seek(nOffset)) {
                *pbaData = file.read(nSize);
            }

            file.close();

            bResult = true;
        } else {
            _setError(ISZ_ERROR_NOTFOUND, tr("Unable to open segment %1: %2").arg(QString::number(nSegment), file.fileName()));
        }
    }

    return bResult;
}

bool XISZ::_processUncompressed(QIODevice *pDevice, quint32 *pnCRC)
{
    bool bResult = true;

    quint32 nCRC = 0;

    qint32 nNumberOfBlocks = g_listChunkPointers.count();

    for (qint32 i = 0; i < nNumberOfBlocks; i++) {
        QByteArray baData;

        if (!decompressBlock(i, &baData)) {
            bResult = false;
            break;
        }

        // Zero chunks are part of the checksum
        nCRC = (quint32)crc32(nCRC, (const Bytef *)baData.constData(), (uInt)baData.size());

        if (pDevice) {
            if (pDevice->write(baData) != baData.size()) {
                _setError(ISZ_ERROR_WRITE, tr("Unable to write block %1").arg(i));
                bResult = false;
                break;
            }
        }

        emit progressChanged(i + 1, nNumberOfBlocks);
    }

    *pnCRC = ~nCRC;

    return bResult;
}

void XISZ::_setError(ISZ_ERROR error, const QString &sErrorString)
{
    g_lastError = error;
    g_sErrorString = sErrorString;

#ifdef QT_DEBUG
    qDebug() << "XISZ:" << sErrorString;
#endif

    emit errorMessage(sErrorString);
}

void XISZ::_clearError()
{
    g_lastError = ISZ_ERROR_NONE;
    g_sErrorString.clear();
}
