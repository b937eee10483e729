#include "cfdp/pdu_config.hpp"
#include "utils/config.hpp"

namespace cfdp {

PduConfig PduConfig::defaultConfig() {
    const auto& defaults = utils::Config::instance().getCodecConfig();
    PduConfig config;
    config.sourceEntityId = UnsignedByteField(0, defaults.entity_id_width);
    config.destEntityId = UnsignedByteField(0, defaults.entity_id_width);
    config.transactionSeqNum = UnsignedByteField(0, defaults.seq_num_width);
    config.crcFlag = defaults.crc_flag ? CrcFlag::WithCrc : CrcFlag::NoCrc;
    config.fileFlag = defaults.large_file ? LargeFileFlag::Large : LargeFileFlag::Normal;
    return config;
}

} // namespace cfdp
