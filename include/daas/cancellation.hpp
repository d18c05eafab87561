#pragma once
#include <atomic>
#include <memory>

#include <daas/error.hpp>

namespace daas
{
   class cancellation_source;

   /**
    * Read side of a cancellation flag. Cheap to copy; all copies observe the
    * same source. A default constructed token is never canceled.
    */
   class cancellation_token
   {
     public:
      cancellation_token() = default;

      bool is_canceled() const
      {
         return _flag && _flag->load(std::memory_order_acquire);
      }

      /// @throw operation_canceled
      void throw_if_canceled() const
      {
         if (is_canceled())
            throw operation_canceled();
      }

     private:
      friend class cancellation_source;
      explicit cancellation_token(std::shared_ptr<const std::atomic<bool>> flag)
          : _flag(std::move(flag))
      {
      }

      std::shared_ptr<const std::atomic<bool>> _flag;
   };

   /**
    * Write side of a cancellation flag, owned by whoever may cancel the work.
    */
   class cancellation_source
   {
     public:
      cancellation_source() : _flag(std::make_shared<std::atomic<bool>>(false)) {}

      void cancel() { _flag->store(true, std::memory_order_release); }
      bool is_canceled() const { return _flag->load(std::memory_order_acquire); }

      cancellation_token token() const { return cancellation_token(_flag); }

     private:
      std::shared_ptr<std::atomic<bool>> _flag;
   };

}  // namespace daas
