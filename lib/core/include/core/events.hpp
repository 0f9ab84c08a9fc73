#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <system_error>
#include <variant>
#include <vector>

namespace courier::core::events {

/// File attached to an outgoing message
struct attachment
{
  std::string filename;
  std::vector<std::uint8_t> contents;

  friend auto operator==(const attachment &, const attachment &) -> bool = default;
};

/// Derived delivery state of an outbound message
enum class outbound_status : std::uint8_t { queued, sent, acked };

/// Raw line typed at the prompt
struct raw_command
{
  std::string input;
};

/// Request display of available commands
struct help
{
};

/// Create a pending contact and produce its key exchange
struct create_contact
{
  std::string name;///< Display name, unique within the session
};

/// Complete a pending contact with the peer's armored key exchange
struct apply_handshake
{
  std::string contact;///< Contact name
  std::string armored;///< Armored key exchange text received out of band
};

/// Compose and queue a message to an active contact
struct compose
{
  std::string contact;///< Recipient contact name
  std::string body;///< Message text
  std::vector<attachment> attachments;
};

/// Complete a pending contact with a key exchange stored in a file
struct accept_file
{
  std::string contact;
  std::string path;
};

/// Send a file as an attachment, with an optional message text
struct send_file
{
  std::string contact;
  std::string path;
  std::string body;
};

/// Treat plain input as messages to this contact
struct chat
{
  std::string contact;
};

/// Leave chat mode
struct leave
{
};

/// Reply to an inbound message
struct reply
{
  std::uint64_t inbound_id{ 0 };///< Inbound message being answered
  std::string body;
};

/// Send an empty acknowledgement for an inbound message
struct ack_inbound
{
  std::uint64_t inbound_id{ 0 };
};

/// Show an inbound message and mark it read
struct open_inbound
{
  std::uint64_t inbound_id{ 0 };
};

/// Show details of one contact
struct show_contact
{
  std::string name;
};

/// Show details of one outbound message
struct show_outbound
{
  std::uint64_t outbound_id{ 0 };
};

struct list_contacts
{
};

struct list_inbox
{
};

struct list_outbox
{
};

struct show_identity
{
};

/// Estimate the serialized size of a draft
struct estimate_usage
{
  std::string body;
  bool is_reply{ false };
  std::vector<attachment> attachments;
};

/// Ask the network actor to transact immediately
struct fetch_now
{
};

/// Persist, stop the actors and stop accepting events
struct shutdown
{
};

/// Input that matched no command
struct unknown_command
{
  std::string input;
};

/// Line of text for the front end
struct display_message
{
  std::string message;
};

/// Queued transmission, copied out of session state for the network actor
struct delivery
{
  std::uint64_t id{ 0 };///< Outbound message id
  std::uint64_t to{ 0 };///< Destination contact id
  std::string server;///< Destination server address
  std::vector<std::uint8_t> to_identity;///< Recipient public identity value
  std::vector<std::uint8_t> credential;///< Member credential the recipient issued to us
  std::uint32_t generation{ 0 };///< Recipient group generation we last saw
  std::vector<std::uint8_t> payload;///< Sealed message record
};

/// Record fetched from the delivery server
struct fetched_record
{
  std::vector<std::uint8_t> credential;///< Member credential presented by the sender
  std::uint32_t generation{ 0 };
  std::vector<std::uint8_t> payload;///< Sealed message record
  std::string handle;///< Transport-specific reference used to release the record
};

/// Network actor events
namespace network {

  /// New record delivered; ack(true) once it is durably absorbed or deliberately dropped, ack(false) to keep it
  struct new_message
  {
    fetched_record record;
    std::function<void(bool)> ack;
  };

  /// Outbound message accepted by the delivery server
  struct message_sent
  {
    std::uint64_t id{ 0 };
  };

  /// Transact immediately instead of waiting for the timer
  struct trigger
  {
    std::function<void()> on_complete;///< Optional, invoked after the transaction
  };

  using in_t = std::variant<trigger>;

}// namespace network

/// Persistence actor events
namespace persistence {

  /// Write a serialized snapshot
  struct save
  {
    std::vector<std::uint8_t> snapshot;
    std::uint64_t sequence{ 0 };
  };

  /// Snapshot with this sequence number is durable
  struct written
  {
    std::uint64_t sequence{ 0 };
  };

  /// A write failed; state on disk is the previous snapshot
  struct write_failed
  {
    std::uint64_t sequence{ 0 };
    std::string reason;
  };

  /// The actor has drained its input and exited
  struct stopped
  {
  };

  using in_t = std::variant<save>;
  using out_t = std::variant<written, write_failed, stopped>;

}// namespace persistence

/// Coordinator output consumed by the presentation handler
struct contact_created
{
  std::string name;
  std::string armored_handshake;
};

struct handshake_applied
{
  std::string name;
  std::size_t unsealed{ 0 };///< Held messages decoded as a result
};

struct message_queued
{
  std::uint64_t id{ 0 };
  std::string to;
  std::string usage;
};

struct message_sent
{
  std::uint64_t id{ 0 };
  std::string to;
};

struct message_acked
{
  std::uint64_t id{ 0 };
  std::string to;
};

struct message_received
{
  std::uint64_t id{ 0 };
  std::string from;
  bool sealed{ false };///< Held until the sender's key exchange is applied
};

struct inbound_opened
{
  std::uint64_t id{ 0 };
  std::string from;
  std::int64_t sent_time{ 0 };
  std::int64_t received_time{ 0 };
  std::string body;
  std::vector<std::string> attachment_names;
  std::optional<std::uint64_t> in_reply_to;
};

struct contact_summary
{
  std::string name;
  bool pending{ true };
};

struct contacts_listed
{
  std::vector<contact_summary> contacts;
};

struct inbox_entry
{
  std::uint64_t id{ 0 };
  std::string from;
  std::int64_t received_time{ 0 };
  bool sealed{ false };
  bool read{ false };
  bool acked{ false };
};

struct inbox_listed
{
  std::vector<inbox_entry> messages;
};

struct outbox_entry
{
  std::uint64_t id{ 0 };
  std::string to;
  std::int64_t created{ 0 };
  outbound_status status{ outbound_status::queued };
};

struct outbox_listed
{
  std::vector<outbox_entry> messages;
};

struct contact_details
{
  std::string name;
  bool pending{ true };
  std::uint32_t generation{ 0 };
  std::string server;
  std::string identity_public_hex;
  std::string armored_handshake;///< Present while the contact is pending
};

struct outbound_details
{
  outbox_entry summary;
  std::int64_t sent{ 0 };
  std::int64_t acked{ 0 };
  std::string body;
};

struct identity_shown
{
  std::string server;
  std::string identity_public_hex;
  std::uint32_t generation{ 0 };
};

struct usage_estimated
{
  std::string usage;
  bool over_limit{ false };
};

struct fetch_completed
{
};

struct operation_failed
{
  std::string operation;
  std::error_code error;
};

struct shutdown_complete
{
};

/// Concept for commands accepted by the session coordinator
template<typename T>
concept Command = std::same_as<T, create_contact> or std::same_as<T, apply_handshake> or std::same_as<T, compose>
                  or std::same_as<T, reply> or std::same_as<T, ack_inbound> or std::same_as<T, open_inbound>
                  or std::same_as<T, show_contact> or std::same_as<T, show_outbound>
                  or std::same_as<T, list_contacts> or std::same_as<T, list_inbox> or std::same_as<T, list_outbox>
                  or std::same_as<T, show_identity> or std::same_as<T, estimate_usage>
                  or std::same_as<T, fetch_now> or std::same_as<T, shutdown>;

using presentation_event_variant_t = std::variant<contact_created,
  handshake_applied,
  message_queued,
  message_sent,
  message_acked,
  message_received,
  inbound_opened,
  contacts_listed,
  inbox_listed,
  outbox_listed,
  contact_details,
  outbound_details,
  identity_shown,
  usage_estimated,
  fetch_completed,
  operation_failed,
  shutdown_complete>;

/// Session coordinator event types
namespace session_coordinator {

  using command_variant_t = std::variant<create_contact,
    apply_handshake,
    compose,
    reply,
    ack_inbound,
    open_inbound,
    show_contact,
    show_outbound,
    list_contacts,
    list_inbox,
    list_outbox,
    show_identity,
    estimate_usage,
    fetch_now,
    shutdown>;

  /// Merged input of the session owner
  using in_t = std::variant<create_contact,
    apply_handshake,
    compose,
    reply,
    ack_inbound,
    open_inbound,
    show_contact,
    show_outbound,
    list_contacts,
    list_inbox,
    list_outbox,
    show_identity,
    estimate_usage,
    fetch_now,
    shutdown,
    network::new_message,
    network::message_sent>;

}// namespace session_coordinator

}// namespace courier::core::events
