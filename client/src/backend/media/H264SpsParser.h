#ifndef H264SPSPARSER_H
#define H264SPSPARSER_H

#include <QByteArray>
#include <QList>
#include <QSize>

/**
 * @brief Extracts the coded picture size from H.264 sequence parameter sets
 *
 * Only the fields needed to reach frame cropping are decoded; VUI and
 * everything after it is ignored.
 */
class H264SpsParser {
public:
    struct SpsInfo {
        int profileIdc = 0;
        int levelIdc = 0;
        int chromaFormatIdc = 1;
        int widthInMbs = 0;
        int heightInMapUnits = 0;
        bool frameMbsOnly = true;
        int cropLeft = 0;
        int cropRight = 0;
        int cropTop = 0;
        int cropBottom = 0;

        // Cropped luma dimensions
        QSize size() const;
    };

    // Returns the NAL units (header byte included) of an Annex-B buffer
    static QList<QByteArray> splitAnnexB(const QByteArray& data);
    // Removes 0x03 emulation prevention bytes
    static QByteArray toRbsp(const QByteArray& nal);
    // nal includes its one-byte header, type must be 7
    static bool parseSps(const QByteArray& nal, SpsInfo* info);
    // Size from the first SPS in an access unit, invalid QSize when none
    static QSize frameSizeFromAccessUnit(const QByteArray& accessUnit);
};

#endif // H264SPSPARSER_H
