#include <algorithm>
#include <cassert>
#include <chrono>
#include <iostream>

#include "callpop/backoff.hpp"

using namespace std;
using namespace callpop;
using std::chrono::milliseconds;

static void doubling_test() {
  ReconnectPolicy p;
  p.jitter = 0.0;
  Backoff b(p);
  assert(b.next() == milliseconds(2000));
  assert(b.next() == milliseconds(4000));
  assert(b.next() == milliseconds(8000));
  assert(b.next() == milliseconds(16000));
  assert(b.next() == milliseconds(32000));
  assert(b.next() == milliseconds(60000));
  assert(b.next() == milliseconds(60000));
  assert(b.attempts() == 7);

  b.reset();
  assert(b.attempts() == 0);
  assert(b.next() == milliseconds(2000));
}

static void jitter_test() {
  ReconnectPolicy p;
  p.max_attempts = 0;
  for (unsigned seed = 1; seed <= 20; seed++) {
    Backoff b(p, seed);
    milliseconds prev(0);
    long long nominal = 2000;
    for (int i = 0; i < 40; i++) {
      milliseconds d = b.next();
      assert(d.count() <= nominal);
      assert(d.count() >= nominal * 8 / 10 - 1);
      assert(d >= prev);
      assert(d <= p.max_delay);
      prev = d;
      nominal = min<long long>(nominal * 2, 60000);
    }
  }
}

static void attempt_limit_test() {
  ReconnectPolicy p;
  p.max_attempts = 3;
  Backoff b(p, 7);
  assert(!b.exhausted());
  b.next();
  b.next();
  assert(!b.exhausted());
  b.next();
  assert(b.exhausted());
  b.reset();
  assert(!b.exhausted());

  ReconnectPolicy forever;
  forever.max_attempts = 0;
  Backoff f(forever, 7);
  for (int i = 0; i < 100; i++) f.next();
  assert(!f.exhausted());
  assert(f.next() <= forever.max_delay);
}

int main(int, const char**) {
  doubling_test();
  jitter_test();
  attempt_limit_test();
  cout << "backoff-test OK" << endl;
  return 0;
}
