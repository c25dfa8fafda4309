#pragma once

namespace rps {
// Marks an argument that the callee reads and mutates, e.g. a random generator that must be
// advanced in place: `choose_move(..., make_in_out(gen))`.
template <typename T>
class InOut {
   public:
    explicit InOut(T &obj) : obj_(obj) {}

    T &operator*() { return obj_; }
    T *operator->() { return &obj_; }

   private:
    T &obj_;
};

template <typename T>
InOut<T> make_in_out(T &obj) {
    return InOut(obj);
}
}  // namespace rps
