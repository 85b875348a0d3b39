#pragma once

#include <anipler/transfer/transfer-types.hxx>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>

#include <set>
#include <mutex>
#include <memory>
#include <string>
#include <vector>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <condition_variable>

namespace anipler
{
  namespace fs = std::filesystem;
  namespace asio = boost::asio;

  // Runs the external copy program.
  //
  // The copy lands in a hidden staging directory next to the destination
  // which is renamed into place only once the program exits successfully.
  // The staging directory is kept on failure so the next attempt resumes
  // from the partial files.
  //
  // Copies to different destinations may overlap (cooperatively, on the
  // io_context); a copy or removal of a destination that is already in use
  // is answered with busy.
  //
  class transfer_executor
  {
  public:
    // Produce the argument vector (program first) that copies the request
    // source into the staging directory.
    //
    using command_builder =
      std::function<std::vector<std::string> (const copy_request&,
                                               const fs::path& staging)>;

    explicit
    transfer_executor (asio::io_context& ioc);

    transfer_executor (const transfer_executor&) = delete;
    transfer_executor& operator= (const transfer_executor&) = delete;

    void
    set_verbose (bool v);

    // Print the command instead of running it.
    //
    void
    set_dry_run (bool v);

    void
    set_command_builder (command_builder b);

    asio::awaitable<transfer_outcome>
    copy (const copy_request& r);

    // Terminate the copies in progress, which then report cancelled, and
    // refuse new ones. Used on shutdown.
    //
    void
    cancel ();

    // Remove the path and everything below it. The path is first renamed
    // aside so it either disappears as a whole or stays untouched; the
    // renamed tree is then deleted on the removal thread. A path that does
    // not exist counts as removed.
    //
    transfer_outcome
    remove (const fs::path& p);

    // Block until the removal thread is idle.
    //
    void
    wait_removals ();

    // Remove what interrupted removals left behind in the directory. Return
    // the number of entries removed.
    //
    std::size_t
    purge_leftovers (const fs::path& dir);

    // rsync over ssh.
    //
    static std::vector<std::string>
    rsync_command (const copy_request&, const fs::path& staging);

    static fs::path
    staging_path (const fs::path& destination);

  private:
    // Mark the destination as in use for the guard's lifetime.
    //
    class busy_guard
    {
    public:
      busy_guard (std::shared_ptr<std::set<std::string>> s, std::string k)
        : set_ (std::move (s)), key_ (std::move (k))
      {
        set_->insert (key_);
      }

      ~busy_guard ()
      {
        set_->erase (key_);
      }

      busy_guard (const busy_guard&) = delete;
      busy_guard& operator= (const busy_guard&) = delete;

    private:
      std::shared_ptr<std::set<std::string>> set_;
      std::string key_;
    };

    asio::io_context& ioc_;
    bool verbose_ = false;
    bool dry_run_ = false;
    bool cancelled_ = false;
    command_builder builder_;

    // Shared with the guards of suspended copies which may be destroyed
    // after the executor.
    //
    std::shared_ptr<std::set<std::string>> busy_;

    // Renamed trees not yet deleted.
    //
    std::mutex removals_mutex_;
    std::condition_variable removals_done_;
    std::set<std::string> removals_;

    // Declared last so it is joined before the state above goes away.
    //
    asio::thread_pool remover_ {1};
  };
}
