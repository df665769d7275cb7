#pragma once

#include <Asserts.hpp>
#include <new>
#include <stddef.h>
#include <stdint.h>

namespace Lla
{

// Fixed capacity stack that never reallocates, so pointers to the items stay valid.
template<typename T, size_t SIZE>
class StaticStack
{
public:
	StaticStack();
	~StaticStack();
	StaticStack(const StaticStack&) = delete;
	StaticStack& operator=(const StaticStack&) = delete;

	[[nodiscard]] bool push(const T& value);
	[[nodiscard]] bool push();
	void pop();
	// Pops items until only newSize are left.
	void shrinkTo(size_t newSize);
	T& peek(size_t i);
	T& top();
	const T& top() const;
	T& operator[](size_t i);
	const T& operator[](size_t i) const;
	bool isEmpty() const;

	T* data();
	const T* data() const;
	size_t size() const;
	size_t maxSize() const;
	T* begin();
	T* end();
	const T* begin() const;
	const T* end() const;
	void clear();

private:
	T* m_top;
	alignas(T) uint8_t m_data[SIZE * sizeof(T)];
};

template<typename T, size_t SIZE>
StaticStack<T, SIZE>::StaticStack()
	: m_top(data())
{}

template<typename T, size_t SIZE>
StaticStack<T, SIZE>::~StaticStack()
{
	clear();
}

template<typename T, size_t SIZE>
bool StaticStack<T, SIZE>::push(const T& value)
{
	if (size() >= maxSize())
	{
		return false;
	}
	new (m_top) T(value);
	m_top++;
	return true;
}

template<typename T, size_t SIZE>
bool StaticStack<T, SIZE>::push()
{
	if (size() >= maxSize())
	{
		return false;
	}
	new (m_top) T();
	m_top++;
	return true;
}

template<typename T, size_t SIZE>
void StaticStack<T, SIZE>::pop()
{
	ASSERT(isEmpty() == false);
	m_top--;
	m_top->~T();
}

template<typename T, size_t SIZE>
void StaticStack<T, SIZE>::shrinkTo(size_t newSize)
{
	ASSERT(newSize <= size());
	while (size() > newSize)
	{
		pop();
	}
}

template<typename T, size_t SIZE>
T& StaticStack<T, SIZE>::peek(size_t i)
{
	ASSERT(i < size());
	return *(m_top - 1 - i);
}

template<typename T, size_t SIZE>
T& StaticStack<T, SIZE>::top()
{
	ASSERT(isEmpty() == false);
	return *(m_top - 1);
}

template<typename T, size_t SIZE>
const T& StaticStack<T, SIZE>::top() const
{
	ASSERT(isEmpty() == false);
	return *(m_top - 1);
}

template<typename T, size_t SIZE>
T& StaticStack<T, SIZE>::operator[](size_t i)
{
	ASSERT(i < size());
	return data()[i];
}

template<typename T, size_t SIZE>
const T& StaticStack<T, SIZE>::operator[](size_t i) const
{
	ASSERT(i < size());
	return data()[i];
}

template<typename T, size_t SIZE>
bool StaticStack<T, SIZE>::isEmpty() const
{
	return m_top == data();
}

template<typename T, size_t SIZE>
T* StaticStack<T, SIZE>::data()
{
	return reinterpret_cast<T*>(m_data);
}

template<typename T, size_t SIZE>
const T* StaticStack<T, SIZE>::data() const
{
	return reinterpret_cast<const T*>(m_data);
}

template<typename T, size_t SIZE>
size_t StaticStack<T, SIZE>::size() const
{
	return static_cast<size_t>(m_top - data());
}

template<typename T, size_t SIZE>
size_t StaticStack<T, SIZE>::maxSize() const
{
	return SIZE;
}

template<typename T, size_t SIZE>
T* StaticStack<T, SIZE>::begin()
{
	return data();
}

template<typename T, size_t SIZE>
T* StaticStack<T, SIZE>::end()
{
	return m_top;
}

template<typename T, size_t SIZE>
const T* StaticStack<T, SIZE>::begin() const
{
	return data();
}

template<typename T, size_t SIZE>
const T* StaticStack<T, SIZE>::end() const
{
	return m_top;
}

template<typename T, size_t SIZE>
void StaticStack<T, SIZE>::clear()
{
	shrinkTo(0);
}

}
