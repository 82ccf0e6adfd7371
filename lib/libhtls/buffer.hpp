#ifndef LIBHTLS_BUFFER_HEADER
#define LIBHTLS_BUFFER_HEADER

#include "libhtls.hpp"

#include <string_view>
#include <vector>

/** \file
 * \brief Declares htls::buffer
 */

namespace htls {

/**
 * \brief The buffer class is a simple buffer where data can be appended at the end and consumed at the front.
 *
 * Consuming data at the front is cheap, the unused space at the front is only reclaimed when more
 * room is needed at the end.
 */
class HTLS_PUBLIC_SYMBOL buffer final
{
public:
	buffer() = default;

	/// Initially reserves the passed capacity
	explicit buffer(size_t capacity);

	/// Undefined if buffer is empty
	unsigned char* get() { return data_.data() + pos_; }
	unsigned char const* get() const { return data_.data() + pos_; }

	/** \brief Returns a writable buffer guaranteed to be large enough for write_size bytes, call \ref add when done.
	 *
	 * \sa append
	 */
	unsigned char* get(size_t write_size);

	/// Increase size by the passed amount. Call this after having obtained a writable buffer with get(size_t write_size)
	void add(size_t added);

	/** \brief Removes consumed bytes from the beginning of the buffer.
	 *
	 * Undefined if consumed > size()
	 */
	void consume(size_t consumed);

	size_t size() const { return size_; }

	/// Does not release the memory.
	void clear();

	/// Appends the passed data to the buffer.
	void append(unsigned char const* data, size_t len);
	void append(std::string_view const& str);
	void append(unsigned char v);

	bool empty() const { return size_ == 0; }
	explicit operator bool() const {
		return size_ != 0;
	}

	/// Gets element at offset i. Does not do bounds checking
	unsigned char operator[](size_t i) const { return data_[pos_ + i]; }

	std::string_view to_view() const {
		return std::string_view(reinterpret_cast<char const*>(get()), size_);
	}

private:
	std::vector<unsigned char> data_;
	size_t pos_{};
	size_t size_{};
};

}

#endif
