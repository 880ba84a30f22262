#include "attachsync/sha256_media_id_deriver.hpp"

#include <vector>

#include "picosha2.h"

std::string SHA256MediaIdDeriver::mediaId(std::string mediaName, std::string mediaRootKey) {
    std::vector<unsigned char> hash(32);
    std::string src_str = mediaRootKey + ":" + mediaName;
    picosha2::hash256(src_str.begin(), src_str.end(), hash.begin(), hash.end());
    return picosha2::bytes_to_hex_string(hash.begin(), hash.begin() + 15);
}
