#ifndef PTR_STACK_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
#define PTR_STACK_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17

#if defined(_MSC_VER) || (defined(__GNUC__) && (__GNUC__ == 3 && __GNUC_MINOR__ >= 4) || (__GNUC__ >= 4)) // GCC supports "pragma once" correctly since 3.4
#pragma once
#endif

#include "ytree/noncopyable.h"
#include <cstddef>
#include <memory>
#include <vector>

namespace YTree
{
	// ptr_stack
	// . A stack that owns its elements; top(-1) is the one below the top.
	template <typename T>
	class ptr_stack: private noncopyable
	{
	public:
		ptr_stack() {}

		void clear() { m_data.clear(); }

		std::size_t size() const { return m_data.size(); }
		bool empty() const { return m_data.empty(); }

		void push(std::unique_ptr<T>&& t) {
			m_data.push_back(std::move(t));
		}

		std::unique_ptr<T> pop() {
			std::unique_ptr<T> t(std::move(m_data.back()));
			m_data.pop_back();
			return t;
		}

		T& top() { return *m_data.back(); }
		const T& top() const { return *m_data.back(); }

		T& top(std::ptrdiff_t diff) { return **(m_data.end() - 1 + diff); }
		const T& top(std::ptrdiff_t diff) const { return **(m_data.end() - 1 + diff); }

	private:
		std::vector<std::unique_ptr<T>> m_data;
	};
}

#endif // PTR_STACK_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
