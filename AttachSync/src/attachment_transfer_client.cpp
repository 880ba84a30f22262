#include "attachsync/attachment_transfer_client.hpp"

std::string TransferTierToString(TransferTier tier) {
    switch (tier) {
        case TransferTier::Transit: return "transit";
        case TransferTier::Media: return "media";
        case TransferTier::MediaThumbnail: return "mediaThumbnail";
    }
    return "unknown";
}
