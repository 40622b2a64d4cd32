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
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>

#include "xisz.h"

static QTextStream g_out(stdout);
static QTextStream g_err(stderr);

static void _printError(XISZ *pISZ)
{
    g_err << pISZ->getErrorString() << Qt::endl;
}

static int _info(const QString &sFileName)
{
    int nResult = 1;

    XISZ isz;

    if (isz.open(sFileName)) {
        g_out << isz.getDescription() << Qt::endl;
        isz.close();
        nResult = 0;
    } else {
        _printError(&isz);
    }

    return nResult;
}

static int _blocks(const QString &sFileName)
{
    int nResult = 1;

    XISZ isz;

    if (isz.open(sFileName)) {
        QList<XISZ_DEF::CHUNK_POINTER> listChunkPointers = isz.getChunkPointers();
        qint32 nNumberOfChunks = listChunkPointers.count();

        for (qint32 i = 0; i < nNumberOfChunks; i++) {
            const XISZ_DEF::CHUNK_POINTER &chunkPointer = listChunkPointers.at(i);

            g_out << QString("%1 %2 %3")
                         .arg(QString::number(chunkPointer.nSize), QString::number(chunkPointer.nSize, 16), XISZ::storageMethodToString(chunkPointer.storageMethod))
                  << Qt::endl;
        }

        isz.close();
        nResult = 0;
    } else {
        _printError(&isz);
    }

    return nResult;
}

static bool _printResult(XISZ *pISZ, bool bResult)
{
    if (bResult) {
        g_out << "PASS" << Qt::endl;
    } else {
        g_out << "ERROR" << Qt::endl;

        if (pISZ->getLastError() != XISZ::ISZ_ERROR_NONE) {
            _printError(pISZ);
        }
    }

    return bResult;
}

static int _verify(const QStringList &listFileNames, bool bSlow)
{
    int nResult = 0;

    qint32 nNumberOfFiles = listFileNames.count();

    for (qint32 i = 0; i < nNumberOfFiles; i++) {
        QString sFileName = listFileNames.at(i);

        XISZ isz;

        if (!isz.open(sFileName)) {
            _printError(&isz);
            nResult = 1;
            continue;
        }

        g_out << QString("Verifying %1 - ").arg(sFileName) << Qt::flush;

        if (!_printResult(&isz, isz.verifyCompressed())) {
            nResult = 1;
        }

        if (bSlow) {
            g_out << QString("Decompressing and Verifying %1 - ").arg(sFileName) << Qt::flush;

            if (!_printResult(&isz, isz.verifyUncompressed())) {
                nResult = 1;
            }
        }

        isz.close();
    }

    return nResult;
}

static int _isz2iso(const QString &sFileName, const QString &sDestFileName)
{
    int nResult = 1;

    QString _sDestFileName = sDestFileName;

    if (_sDestFileName.isEmpty()) {
        _sDestFileName = XISZ::getDefaultImageFileName(sFileName);
    }

    g_out << QString("Extracting %1 to %2 - ").arg(sFileName, _sDestFileName) << Qt::flush;

    XISZ isz;

    if (isz.open(sFileName) && isz.extractToFile(_sDestFileName)) {
        g_out << "Done" << Qt::endl;
        nResult = 0;
    } else {
        g_out << "ERROR" << Qt::endl;
        _printError(&isz);
    }

    isz.close();

    return nResult;
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("isztool");
    QCoreApplication::setApplicationVersion("1.00");

    QCommandLineParser parser;
    parser.setApplicationDescription("Handle .isz files (ISO zipped)");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command", "info | blocks | verify | isz2iso (2iso)");
    parser.addPositionalArgument("files", "ISZ file(s) and, for isz2iso, an optional destination ISO", "[files...]");

    QCommandLineOption optionSlow(QStringList() << "s" << "slow", "verify: also decompress and verify the result");
    parser.addOption(optionSlow);

    parser.process(app);

    QStringList listArgs = parser.positionalArguments();

    int nResult = 1;

    if (listArgs.count() >= 2) {
        QString sCommand = listArgs.takeFirst();

        if (sCommand == "info") {
            nResult = _info(listArgs.at(0));
        } else if (sCommand == "blocks") {
            nResult = _blocks(listArgs.at(0));
        } else if (sCommand == "verify") {
            nResult = _verify(listArgs, parser.isSet(optionSlow));
        } else if ((sCommand == "isz2iso") || (sCommand == "2iso")) {
            nResult = _isz2iso(listArgs.at(0), listArgs.value(1));
        } else {
            g_err << QString("Unknown command: %1").arg(sCommand) << Qt::endl;
            parser.showHelp(1);
        }
    } else {
        parser.showHelp(1);
    }

    return nResult;
}
