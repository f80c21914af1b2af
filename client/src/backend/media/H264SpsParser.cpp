#include "backend/media/H264SpsParser.h"

namespace {
    // Exp-Golomb bit reader; reads past the end return zero bits
    class BitReader {
    public:
        explicit BitReader(const QByteArray& data) : m_data(data) {}

        quint32 readBit() {
            if (m_bytePos >= m_data.size()) {
                m_overrun = true;
                return 0;
            }
            const quint32 bit = (static_cast<quint8>(m_data.at(m_bytePos)) >> (7 - m_bitPos)) & 1;
            if (++m_bitPos == 8) {
                m_bitPos = 0;
                ++m_bytePos;
            }
            return bit;
        }

        quint32 readBits(int n) {
            quint32 value = 0;
            for (int i = 0; i < n; ++i) value = (value << 1) | readBit();
            return value;
        }

        bool readFlag() { return readBit() != 0; }

        quint32 readUE() {
            int leadingZeros = 0;
            while (readBit() == 0 && leadingZeros < 32) {
                ++leadingZeros;
                if (m_overrun) return 0;
            }
            if (leadingZeros == 0) return 0;
            return (1u << leadingZeros) - 1 + readBits(leadingZeros);
        }

        qint32 readSE() {
            const quint32 ue = readUE();
            qint32 se = static_cast<qint32>((ue + 1) / 2);
            return (ue & 1) == 0 ? -se : se;
        }

        bool overrun() const { return m_overrun; }

    private:
        QByteArray m_data;
        int m_bytePos = 0;
        int m_bitPos = 0;
        bool m_overrun = false;
    };

    void skipScalingList(BitReader& br, int size) {
        int lastScale = 8;
        int nextScale = 8;
        for (int i = 0; i < size; ++i) {
            if (nextScale != 0) {
                nextScale = (lastScale + br.readSE() + 256) % 256;
            }
            lastScale = nextScale == 0 ? lastScale : nextScale;
        }
    }

    bool hasHighProfileFields(int profileIdc) {
        switch (profileIdc) {
            case 100: case 110: case 122: case 244: case 44: case 83:
            case 86: case 118: case 128: case 138: case 139: case 134: case 135:
                return true;
            default:
                return false;
        }
    }
}

QSize H264SpsParser::SpsInfo::size() const {
    int width = widthInMbs * 16;
    int height = heightInMapUnits * 16 * (frameMbsOnly ? 1 : 2);
    const int cropUnitX = chromaFormatIdc == 0 ? 1 : 2;
    int cropUnitY = chromaFormatIdc == 0 ? 1 : 2;
    if (!frameMbsOnly) cropUnitY *= 2;
    width -= (cropLeft + cropRight) * cropUnitX;
    height -= (cropTop + cropBottom) * cropUnitY;
    return QSize(width, height);
}

QList<QByteArray> H264SpsParser::splitAnnexB(const QByteArray& data) {
    QList<QByteArray> nals;
    const int size = data.size();
    int pos = 0;
    int start = -1;
    while (pos + 2 < size) {
        if (data.at(pos) == 0 && data.at(pos + 1) == 0 && data.at(pos + 2) == 1) {
            if (start >= 0) {
                int end = pos;
                // A 4-byte start code leaves one trailing zero on the previous NAL
                while (end > start && data.at(end - 1) == 0) --end;
                nals.append(data.mid(start, end - start));
            }
            pos += 3;
            start = pos;
            continue;
        }
        ++pos;
    }
    if (start >= 0 && start < size) {
        nals.append(data.mid(start));
    }
    return nals;
}

QByteArray H264SpsParser::toRbsp(const QByteArray& nal) {
    QByteArray rbsp;
    rbsp.reserve(nal.size());
    int zeros = 0;
    for (int i = 0; i < nal.size(); ++i) {
        const char byte = nal.at(i);
        if (zeros >= 2 && byte == 0x03) {
            zeros = 0;
            continue;
        }
        rbsp.append(byte);
        zeros = byte == 0 ? zeros + 1 : 0;
    }
    return rbsp;
}

bool H264SpsParser::parseSps(const QByteArray& nal, SpsInfo* info) {
    if (nal.size() < 4 || (nal.at(0) & 0x1F) != 7) {
        return false;
    }
    BitReader br(toRbsp(nal.mid(1)));
    SpsInfo sps;

    sps.profileIdc = static_cast<int>(br.readBits(8));
    br.readBits(8);  // constraint flags + reserved
    sps.levelIdc = static_cast<int>(br.readBits(8));
    br.readUE();  // seq_parameter_set_id

    if (hasHighProfileFields(sps.profileIdc)) {
        sps.chromaFormatIdc = static_cast<int>(br.readUE());
        if (sps.chromaFormatIdc == 3) {
            br.readFlag();  // separate_colour_plane_flag
        }
        br.readUE();  // bit_depth_luma_minus8
        br.readUE();  // bit_depth_chroma_minus8
        br.readFlag();  // qpprime_y_zero_transform_bypass_flag
        if (br.readFlag()) {
            const int lists = sps.chromaFormatIdc != 3 ? 8 : 12;
            for (int i = 0; i < lists; ++i) {
                if (br.readFlag()) skipScalingList(br, i < 6 ? 16 : 64);
            }
        }
    }

    br.readUE();  // log2_max_frame_num_minus4
    const quint32 pocType = br.readUE();
    if (pocType == 0) {
        br.readUE();  // log2_max_pic_order_cnt_lsb_minus4
    } else if (pocType == 1) {
        br.readFlag();  // delta_pic_order_always_zero_flag
        br.readSE();  // offset_for_non_ref_pic
        br.readSE();  // offset_for_top_to_bottom_field
        const quint32 cycle = br.readUE();
        if (cycle > 255) return false;
        for (quint32 i = 0; i < cycle; ++i) br.readSE();
    }

    br.readUE();  // max_num_ref_frames
    br.readFlag();  // gaps_in_frame_num_value_allowed_flag
    sps.widthInMbs = static_cast<int>(br.readUE()) + 1;
    sps.heightInMapUnits = static_cast<int>(br.readUE()) + 1;

    sps.frameMbsOnly = br.readFlag();
    if (!sps.frameMbsOnly) {
        br.readFlag();  // mb_adaptive_frame_field_flag
    }
    br.readFlag();  // direct_8x8_inference_flag

    if (br.readFlag()) {
        sps.cropLeft = static_cast<int>(br.readUE());
        sps.cropRight = static_cast<int>(br.readUE());
        sps.cropTop = static_cast<int>(br.readUE());
        sps.cropBottom = static_cast<int>(br.readUE());
    }

    if (br.overrun()) {
        return false;
    }
    const QSize size = sps.size();
    if (size.width() <= 0 || size.height() <= 0 || size.width() > 16384 || size.height() > 16384) {
        return false;
    }
    if (info) *info = sps;
    return true;
}

QSize H264SpsParser::frameSizeFromAccessUnit(const QByteArray& accessUnit) {
    const QList<QByteArray> nals = splitAnnexB(accessUnit);
    for (const QByteArray& nal : nals) {
        if (nal.isEmpty() || (nal.at(0) & 0x1F) != 7) continue;
        SpsInfo info;
        if (parseSps(nal, &info)) {
            return info.size();
        }
    }
    return QSize();
}
