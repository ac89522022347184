/**
 * @file Charset.cpp
 * @brief ICU based charset support for the reverse line scanner.
 *
 * Backward scanning only works when a terminator byte sequence found at a
 * character boundary is always a real terminator. That holds for:
 *  - single byte charsets;
 *  - ASCII compatible multi byte charsets (UTF-8, Shift_JIS, GBK, Big5, EUC-*),
 *    whose lead/trail bytes never take the values of CR or LF;
 *  - UTF-16/UTF-32 with an explicit byte order, scanned one code unit at a time.
 * Everything else (stateful ISO-2022, HZ, UTF-7, SCSU, BOCU-1, EBCDIC SI/SO,
 * BOM-dependent UTF-16/UTF-32, ...) is rejected up front.
 *
 * Decoding uses the STOP callback, so malformed input is reported instead of
 * being replaced with U+FFFD.
 */

#include "Charset.hpp"
#include "utils/common.hpp"

#include <climits>
#include <unicode/unistr.h>
#include <unicode/ustring.h>

static const char* type_name(UConverterType type) {
    switch (type) {
        case UCNV_SBCS: return "SBCS";
        case UCNV_DBCS: return "DBCS";
        case UCNV_MBCS: return "MBCS";
        case UCNV_LATIN_1: return "Latin-1";
        case UCNV_UTF8: return "UTF-8";
        case UCNV_UTF16_BigEndian: return "UTF-16BE";
        case UCNV_UTF16_LittleEndian: return "UTF-16LE";
        case UCNV_UTF32_BigEndian: return "UTF-32BE";
        case UCNV_UTF32_LittleEndian: return "UTF-32LE";
        case UCNV_EBCDIC_STATEFUL: return "EBCDIC stateful";
        case UCNV_ISO_2022: return "ISO-2022";
        case UCNV_HZ: return "HZ";
        case UCNV_SCSU: return "SCSU";
        case UCNV_ISCII: return "ISCII";
        case UCNV_US_ASCII: return "US-ASCII";
        case UCNV_UTF7: return "UTF-7";
        case UCNV_BOCU1: return "BOCU-1";
        case UCNV_UTF16: return "UTF-16 (byte order mark)";
        case UCNV_UTF32: return "UTF-32 (byte order mark)";
        case UCNV_CESU8: return "CESU-8";
        case UCNV_IMAP_MAILBOX: return "IMAP mailbox";
        case UCNV_COMPOUND_TEXT: return "compound text";
        default:
            if (type >= UCNV_LMBCS_1 && type <= UCNV_LMBCS_LAST) {
                return "LMBCS";
            }
            return "unknown";
    }
}

/**
 * @brief Opens an ICU converter and checks that it can be scanned backwards.
 *
 * @param name Any charset name or alias known to ICU ("UTF-8", "Shift_JIS", "windows-1252", ...).
 * @throws UnsupportedError If ICU does not know the charset, or it is stateful,
 *         BOM-dependent, or its CR/LF encoding is ambiguous.
 */
Charset::Charset(const std::string& name) {
    if (name.empty()) {
        throw UnsupportedError("empty charset name");
    }

    UErrorCode err = U_ZERO_ERROR;
    m_cnv.reset(ucnv_open(name.c_str(), &err));
    if (U_FAILURE(err) || !m_cnv) {
        m_cnv.reset();
        throw UnsupportedError(fmt::format("unknown charset \"{}\": {}", name, u_errorName(err)));
    }

    const char* canonical = ucnv_getName(m_cnv.get(), &err);
    m_name = U_SUCCESS(err) && canonical ? canonical : name;

    const UConverterType type = ucnv_getType(m_cnv.get());
    switch (type) {
        case UCNV_SBCS:
        case UCNV_MBCS:
        case UCNV_LATIN_1:
        case UCNV_UTF8:
        case UCNV_US_ASCII:
        case UCNV_CESU8:
            m_step = 1;
            break;
        case UCNV_UTF16_BigEndian:
        case UCNV_UTF16_LittleEndian:
            m_step = 2;
            break;
        case UCNV_UTF32_BigEndian:
        case UCNV_UTF32_LittleEndian:
            m_step = 4;
            break;
        case UCNV_UTF16:
        case UCNV_UTF32:
            throw UnsupportedError(fmt::format("charset \"{}\": byte order is not fixed, use the BE or LE variant", name));
        default:
            throw UnsupportedError(fmt::format("charset \"{}\" ({}) has no fixed maximum character size", name, type_name(type)));
    }

    m_max_char_size = ucnv_getMaxCharSize(m_cnv.get());
    m_min_char_size = ucnv_getMinCharSize(m_cnv.get());

    ucnv_setToUCallBack(m_cnv.get(), UCNV_TO_U_CALLBACK_STOP, nullptr, nullptr, nullptr, &err);
    ucnv_setFromUCallBack(m_cnv.get(), UCNV_FROM_U_CALLBACK_STOP, nullptr, nullptr, nullptr, &err);
    if (U_FAILURE(err)) {
        throw UnsupportedError(fmt::format("charset \"{}\": cannot set callbacks: {}", name, u_errorName(err)));
    }

    m_crlf = encode_ascii("\r\n");
    m_lf = encode_ascii("\n");
    m_cr = encode_ascii("\r");

    buf_t cr_lf = m_cr;
    cr_lf.insert(cr_lf.end(), m_lf.begin(), m_lf.end());
    if ((int)m_lf.size() != m_step || (int)m_cr.size() != m_step || m_crlf != cr_lf) {
        throw UnsupportedError(fmt::format("charset \"{}\": line terminators are not {}-byte units", name, m_step));
    }

    if (type == UCNV_MBCS) {
        // a terminator byte that can start a multi byte sequence would be ambiguous when scanning backwards
        UBool starters[256];
        ucnv_getStarters(m_cnv.get(), starters, &err);
        if (U_FAILURE(err)) {
            throw UnsupportedError(fmt::format("charset \"{}\": cannot get lead bytes: {}", name, u_errorName(err)));
        }
        if (starters[m_lf[0]] || starters[m_cr[0]]) {
            throw UnsupportedError(fmt::format("charset \"{}\": CR/LF bytes can start a multi byte character", name));
        }
    }

    logger->debug("charset {}: {}, {}..{} bytes per char, step {}", m_name, type_name(type), m_min_char_size, m_max_char_size, m_step);
}

buf_t Charset::encode_ascii(const char* str) const {
    UChar src[8];
    int32_t src_len = 0;
    for (; str[src_len] && src_len < (int32_t)(sizeof(src)/sizeof(src[0])); src_len++) {
        src[src_len] = (UChar)str[src_len];
    }

    char dest[32];
    UErrorCode err = U_ZERO_ERROR;
    int32_t len = ucnv_fromUChars(m_cnv.get(), dest, sizeof(dest), src, src_len, &err);
    if (U_FAILURE(err)) {
        throw UnsupportedError(fmt::format("charset \"{}\": cannot encode line terminators: {}", m_name, u_errorName(err)));
    }
    return buf_t(dest, len);
}

/**
 * @brief Decodes a complete byte sequence into UTF-8.
 *
 * @param data Encoded bytes, must hold only whole characters.
 * @param size Number of bytes.
 * @param offset File offset of @p data, for the error message.
 * @return UTF-8 text.
 * @throws DecodeError On an illegal, unmappable or truncated sequence.
 */
std::string Charset::decode(const uint8_t* data, size_t size, off_t offset) {
    if (size == 0) {
        return {};
    }
    if (size > INT32_MAX) {
        throw DecodeError(fmt::format("{}: line at {:#x} is too long to decode ({} bytes)", m_name, offset, size));
    }

    UErrorCode err = U_ZERO_ERROR;
    icu::UnicodeString ustr(reinterpret_cast<const char*>(data), (int32_t)size, m_cnv.get(), err);
    if (U_FAILURE(err)) {
        throw DecodeError(fmt::format("{}: cannot decode {} bytes at {:#x}: {}", m_name, size, offset, u_errorName(err)));
    }

    std::string result;
    ustr.toUTF8String(result);
    return result;
}

/**
 * @brief Encodes UTF-8 text into this charset.
 *
 * Used to build test input and by the self-test.
 *
 * @throws DecodeError If @p utf8 is malformed or a character has no mapping in this charset.
 */
buf_t Charset::encode(const std::string& utf8) {
    if (utf8.empty()) {
        return {};
    }
    if (utf8.size() > INT32_MAX) {
        throw DecodeError(fmt::format("{}: text is too long to encode ({} bytes)", m_name, utf8.size()));
    }

    UErrorCode err = U_ZERO_ERROR;
    int32_t ulen = 0;
    u_strFromUTF8(nullptr, 0, &ulen, utf8.data(), (int32_t)utf8.size(), &err);
    if (err != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(err)) {
        throw DecodeError(fmt::format("{}: invalid UTF-8 input: {}", m_name, u_errorName(err)));
    }

    icu::UnicodeString ustr = icu::UnicodeString::fromUTF8(icu::StringPiece(utf8.data(), (int32_t)utf8.size()));
    err = U_ZERO_ERROR;
    int32_t len = ustr.extract(nullptr, 0, m_cnv.get(), err);
    if (err != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(err)) {
        throw DecodeError(fmt::format("{}: cannot encode text: {}", m_name, u_errorName(err)));
    }

    buf_t result(len);
    err = U_ZERO_ERROR;
    ustr.extract(reinterpret_cast<char*>(result.data()), len, m_cnv.get(), err);
    if (U_FAILURE(err)) {
        throw DecodeError(fmt::format("{}: cannot encode text: {}", m_name, u_errorName(err)));
    }
    return result;
}

/**
 * @brief Checks whether a charset name would be accepted by the constructor.
 */
bool Charset::is_supported(const std::string& name) {
    try {
        Charset charset(name);
        return true;
    } catch (const UnsupportedError&) {
        return false;
    }
}
