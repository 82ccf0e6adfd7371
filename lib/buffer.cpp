#include "libhtls/buffer.hpp"

#include <cstring>

namespace htls {

buffer::buffer(size_t capacity)
{
	data_.reserve(capacity);
}

unsigned char* buffer::get(size_t write_size)
{
	if (data_.size() - pos_ - size_ < write_size) {
		if (pos_ && data_.size() - size_ >= write_size) {
			// Move existing data to the front to make room
			memmove(data_.data(), data_.data() + pos_, size_);
			pos_ = 0;
		}
		else {
			data_.resize(pos_ + size_ + write_size);
		}
	}

	return data_.data() + pos_ + size_;
}

void buffer::add(size_t added)
{
	if (data_.size() - pos_ - size_ < added) {
		// Undefined, but don't corrupt memory
		added = data_.size() - pos_ - size_;
	}
	size_ += added;
}

void buffer::consume(size_t consumed)
{
	if (consumed > size_) {
		consumed = size_;
	}
	if (consumed == size_) {
		pos_ = 0;
		size_ = 0;
	}
	else {
		pos_ += consumed;
		size_ -= consumed;
	}
}

void buffer::clear()
{
	pos_ = 0;
	size_ = 0;
}

void buffer::append(unsigned char const* data, size_t len)
{
	if (!len) {
		return;
	}
	unsigned char* p = get(len);
	memcpy(p, data, len);
	size_ += len;
}

void buffer::append(std::string_view const& str)
{
	append(reinterpret_cast<unsigned char const*>(str.data()), str.size());
}

void buffer::append(unsigned char v)
{
	append(&v, 1);
}

}
