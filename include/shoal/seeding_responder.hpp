#ifndef SHOAL_SEEDING_RESPONDER_HEADER
#define SHOAL_SEEDING_RESPONDER_HEADER

#include "file_metadata.hpp"
#include "byte_source.hpp"
#include "types.hpp"

#include <unordered_map>
#include <memory>
#include <vector>

namespace shoal {

class channel_directory;
class transport;

/** A file we hold in its entirety and can serve to others. */
struct local_file
{
    file_metadata metadata;
    std::shared_ptr<const byte_source> source;
    // The channel the file was uploaded to or downloaded from.
    channel_ref channel;
    // Whether a record of it exists in the seed store.
    bool is_persisted = false;
};

/**
 * Keeps the table of local files and answers other peers' requests for them: source
 * requests are answered with a source announcement, piece requests addressed to us
 * with the requested piece.
 *
 * Responses are encrypted with the key the channel directory reports for the channel
 * on which the request arrived.
 */
class seeding_responder
{
    transport& transport_;
    const channel_directory& channels_;
    std::unordered_map<file_id_t, local_file> files_;

public:
    seeding_responder(transport& transport, const channel_directory& channels);

    void add(local_file file);
    /** Returns whether a file with this id was held. */
    bool remove(const file_id_t& file_id);
    void clear() { files_.clear(); }

    bool contains(const file_id_t& file_id) const;
    const local_file* find(const file_id_t& file_id) const;
    local_file* find(const file_id_t& file_id);
    int num_files() const noexcept { return files_.size(); }

    void on_source_request(const channel_ref& channel, const file_id_t& file_id);

    /**
     * `target` must already have been matched against the local identity. Requests
     * for unknown files or out of range pieces are ignored.
     */
    void on_piece_request(const channel_ref& channel, const file_id_t& file_id,
            const piece_index_t index);

    /** Announces ourselves as a source of `file_id` on `channel`. */
    void announce(const channel_ref& channel, const file_id_t& file_id,
            const channel_key& key);

    /**
     * Announces every held file that belongs to `channel`. Returns the number of
     * announcements made.
     */
    int announce_channel_files(const channel_ref& channel, const channel_key& key);

    /** Ids of the files held for `channel`. */
    std::vector<file_id_t> files_in_channel(const channel_ref& channel) const;
};

} // namespace shoal

#endif // SHOAL_SEEDING_RESPONDER_HEADER
