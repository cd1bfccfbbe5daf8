#include "seeding_responder.hpp"
#include "string_utils.hpp"
#include "transport.hpp"
#include "protocol.hpp"
#include "log.hpp"

namespace shoal {

seeding_responder::seeding_responder(
        transport& transport, const channel_directory& channels)
    : transport_(transport), channels_(channels)
{}

void seeding_responder::add(local_file file)
{
    auto file_id = file.metadata.file_id;
    files_[std::move(file_id)] = std::move(file);
}

bool seeding_responder::remove(const file_id_t& file_id)
{
    return files_.erase(file_id) > 0;
}

bool seeding_responder::contains(const file_id_t& file_id) const
{
    return files_.count(file_id) > 0;
}

const local_file* seeding_responder::find(const file_id_t& file_id) const
{
    auto it = files_.find(file_id);
    return it != files_.end() ? &it->second : nullptr;
}

local_file* seeding_responder::find(const file_id_t& file_id)
{
    auto it = files_.find(file_id);
    return it != files_.end() ? &it->second : nullptr;
}

void seeding_responder::on_source_request(
        const channel_ref& channel, const file_id_t& file_id)
{
    if(contains(file_id)) {
        announce(channel, file_id, channels_.key_for(channel));
    }
}

void seeding_responder::on_piece_request(
        const channel_ref& channel, const file_id_t& file_id, const piece_index_t index)
{
    const auto* file = find(file_id);
    if(file == nullptr || index < 0 || index >= file->metadata.num_pieces) {
        return;
    }
    const auto& metadata = file->metadata;
    const auto piece = file->source->slice(
            metadata.piece_offset(index), metadata.piece_length(index));
#ifdef SHOAL_ENABLE_LOGGING
    log::log_engine("SEED",
            util::format("serving piece %d (%d bytes) of %s on %s", index,
                    int(piece.size()), file_id.c_str(), channel.c_str()),
            log::priority::low);
#endif // SHOAL_ENABLE_LOGGING
    transport_.broadcast(channel,
            protocol::encode_file_piece(
                    file_id, index, channels_.local_peer_id(), piece),
            channels_.key_for(channel));
}

void seeding_responder::announce(
        const channel_ref& channel, const file_id_t& file_id, const channel_key& key)
{
    transport_.broadcast(channel,
            protocol::encode_source_announce(file_id, channels_.local_peer_id()), key);
}

int seeding_responder::announce_channel_files(
        const channel_ref& channel, const channel_key& key)
{
    const auto file_ids = files_in_channel(channel);
    for(const auto& file_id : file_ids) {
        announce(channel, file_id, key);
    }
    return file_ids.size();
}

std::vector<file_id_t> seeding_responder::files_in_channel(const channel_ref& channel) const
{
    std::vector<file_id_t> file_ids;
    for(const auto& e : files_) {
        if(e.second.channel == channel) {
            file_ids.emplace_back(e.first);
        }
    }
    return file_ids;
}

} // namespace shoal
