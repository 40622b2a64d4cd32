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
#ifndef XISZ_H
#define XISZ_H

#include <QFile>
#include <QList>

#include "xdecompress.h"
#include "xisz_def.h"

class XISZ : public QObject {
    Q_OBJECT

public:
    enum ISZ_ERROR {
        ISZ_ERROR_NONE = 0,
        ISZ_ERROR_FORMAT,
        ISZ_ERROR_NOTFOUND,
        ISZ_ERROR_INTEGRITY,
        ISZ_ERROR_DECOMPRESSION,
        ISZ_ERROR_WRITE
    };

    // How the files of a multi-segment set are named
    enum NAMING {
        NAMING_NOCHANGE = 0,  // single file
        NAMING_IXX,           // name.isz, name.i01, name.i02 ...
        NAMING_PARTXX,        // name.part01.isz, name.part02.isz ...
        NAMING_PARTXXX        // name.part001.isz, name.part002.isz ...
    };

    struct BLOCK_LOCATION {
        qint32 nSegment;
        qint64 nOffset;
        qint64 nSize;      // bytes read from nSegment
        qint64 nLeftSize;  // bytes read from nSegment + 1, right after its header
    };

    explicit XISZ(QObject *pParent = nullptr);
    ~XISZ();

    bool open(const QString &sFileName);
    void close();
    bool isOpen();

    static bool isValid(QIODevice *pDevice);
    static bool readHeader(QIODevice *pDevice, XISZ_DEF::HEADER *pHeader, QString *psErrorString = nullptr);
    static QByteArray headerToByteArray(const XISZ_DEF::HEADER &header);
    static XISZ_DEF::SEGMENT decodeSegment(const char *pData);
    static XISZ_DEF::CHUNK_POINTER decodeChunkPointer(const char *pData);

    /*!
        \brief XOR (de)obfuscation of the segment and chunk pointer tables.
        Applying it twice restores the input.
    */
    static void xorObfuscate(char *pData, qint64 nSize);
    static QByteArray xorObfuscate(const QByteArray &baData);

    static QString getSegmentFileName(const QString &sFileName, NAMING naming, qint32 nIndex);
    static bool detectNaming(const QString &sFileName, NAMING *pNaming, QString *psErrorString = nullptr);
    static bool locateBlock(const QList<XISZ_DEF::SEGMENT> &listSegments, const QList<XISZ_DEF::CHUNK_POINTER> &listChunkPointers, qint32 nBlock,
                            BLOCK_LOCATION *pLocation);

    static QString encryptionTypeToString(quint8 nEncryptionType);
    static QString storageMethodToString(XISZ_DEF::STORAGE_METHOD storageMethod);
    static quint64 getUncompressedSize(const XISZ_DEF::HEADER &header);
    static QString getDefaultImageFileName(const QString &sFileName);

    XISZ_DEF::HEADER getHeader();
    QList<XISZ_DEF::SEGMENT> getSegments();
    QList<XISZ_DEF::CHUNK_POINTER> getChunkPointers();
    NAMING getNaming();
    QString getFileName();
    QString getSegmentFileName(qint32 nIndex);
    quint64 getUncompressedSize();
    quint32 getVolumeSerialNumber();
    QString getEncryptionTypeString();
    bool isEncrypted();
    QString getDescription();

    bool readBlock(qint32 nBlock, QByteArray *pbaData);
    bool decompressBlock(qint32 nBlock, QByteArray *pbaData);

    // false with ISZ_ERROR_NONE: checksum mismatch
    bool verifyCompressed();
    bool verifyUncompressed();
    bool extract(QIODevice *pDevice);
    bool extractToFile(const QString &sFileName);

    ISZ_ERROR getLastError();
    QString getErrorString();

signals:
    void errorMessage(const QString &sText);
    void warningMessage(const QString &sText);
    void progressChanged(qint64 nCurrent, qint64 nTotal);

private:
    bool _readSegments();
    bool _readChunkPointers();
    bool _checkSegmentFiles();
    bool _checkAccess();
    bool _readData(qint32 nSegment, qint64 nOffset, qint64 nSize, QByteArray *pbaData);
    bool _processUncompressed(QIODevice *pDevice, quint32 *pnCRC);
    void _setError(ISZ_ERROR error, const QString &sErrorString);
    void _clearError();

private:
    QFile *g_pFile;
    QString g_sFileName;
    XISZ_DEF::HEADER g_header;
    QList<XISZ_DEF::SEGMENT> g_listSegments;
    QList<XISZ_DEF::CHUNK_POINTER> g_listChunkPointers;
    NAMING g_naming;
    ISZ_ERROR g_lastError;
    QString g_sErrorString;
};

#endif  // XISZ_H
