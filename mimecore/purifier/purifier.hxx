/**
 * @file purifier.hxx
 * @brief Defines the purifier interface run on a stream before type detection.
 */

#ifndef MIMECORE_PURIFIER_HXX
#define MIMECORE_PURIFIER_HXX

namespace mimecore::purifier {
    /**
     * @brief Base class for input cleaners.
     *
     * A detector may call a purifier to clean its input before sniffing. The stream
     * must be resettable: after purify() returns, the detector reads the cleaned
     * content again from the beginning.
     */
    class c_base_purifier {
      public:
        /**
         * @brief Purify a resettable stream in place.
         * @param stream Stream to clean; left positioned at its beginning.
         * @throws exceptions::purifier_exception_t on I/O failure.
         */
        virtual void purify(std::iostream& stream) = 0;

        /**
         * @brief Virtual destructor.
         */
        virtual ~c_base_purifier() = default;
    };

    /**
     * @brief Shared pointer type for purifiers.
     */
    using purifier_t = std::shared_ptr<c_base_purifier>;
}

#endif // MIMECORE_PURIFIER_HXX
